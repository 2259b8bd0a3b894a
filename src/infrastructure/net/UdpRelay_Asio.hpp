#pragma once

#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <optional>
#include <thread>
#include <vector>

#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IRelay.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::infrastructure::net
{

// Datagram side of the relay. Appliance datagrams go to the receiver verbatim;
// receiver replies inside the window go back to the appliance. When the window
// closes the relay answers the appliance itself.
class UdpRelay_Asio final : public scanbridge::application::ports::IDatagramRelay
{
 public:
  using udp = boost::asio::ip::udp;

  UdpRelay_Asio(const domain::Settings& s, const application::ports::IFrameCodec& codec,
                application::ports::ILogger& log);
  ~UdpRelay_Asio() override;

  bool start() override;
  void stop() override;
  bool running() const override { return running_; }
  uint16_t local_port() const override { return port_; }

 private:
  void do_receive();
  void handle(std::size_t n);
  void open_window(std::span<const std::byte> request);
  void close_window();
  void forward(std::span<const std::byte> data, const udp::endpoint& to,
               application::ports::RelayDirection dir);

  const domain::Settings& s_;
  const application::ports::IFrameCodec& codec_;
  application::ports::ILogger& log_;

  boost::asio::io_context io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_{io_.get_executor()};
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
  udp::socket socket_{strand_};
  boost::asio::steady_timer window_{strand_};

  boost::asio::ip::network_v4 appliance_net_;
  udp::endpoint receiver_;

  // strand-only state
  std::vector<std::byte> buf_;
  udp::endpoint from_;
  bool window_open_{false};
  udp::endpoint appliance_;
  std::vector<std::byte> request_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
};

}  // namespace scanbridge::infrastructure::net
