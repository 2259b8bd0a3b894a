#pragma once

#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <optional>
#include <thread>
#include <vector>

#include "application/ports/IFrameCodec.hpp"
#include "application/ports/IListener.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::infrastructure::net
{

// UDP responder for discovery and file-transfer probes. Bad datagrams are
// logged and dropped; the receive loop never ends on a per-datagram error.
class FrameResponder_Asio final : public scanbridge::application::ports::IFrameResponder
{
 public:
  using udp = boost::asio::ip::udp;

  FrameResponder_Asio(const domain::Settings& s, const application::ports::IFrameCodec& codec,
                      application::ports::ILogger& log);
  ~FrameResponder_Asio() override;

  bool start() override;
  void stop() override;
  bool running() const override { return running_; }
  uint16_t local_port() const override { return port_; }

 private:
  void do_receive();
  void handle(std::size_t n);

  const domain::Settings& s_;
  const application::ports::IFrameCodec& codec_;
  application::ports::ILogger& log_;

  boost::asio::io_context io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_{io_.get_executor()};
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
  udp::socket socket_{strand_};

  std::vector<std::byte> buf_;
  udp::endpoint from_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
};

}  // namespace scanbridge::infrastructure::net
