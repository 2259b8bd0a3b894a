#pragma once

#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IRelay.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::infrastructure::net
{

class RelaySession;

// Stream side of the relay: one outbound receiver connection per accepted
// appliance connection, bytes pumped both ways until both directions end.
class TcpRelay_Asio final : public scanbridge::application::ports::IStreamRelay
{
 public:
  using tcp = boost::asio::ip::tcp;

  TcpRelay_Asio(const domain::Settings& s, application::ports::ILogger& log);
  ~TcpRelay_Asio() override;

  bool start() override;
  void stop() override;
  bool running() const override { return running_; }
  uint16_t local_port() const override { return port_; }

 private:
  friend class RelaySession;

  void do_accept();
  void finished(const application::ports::RelaySessionStats& st);

  const domain::Settings& s_;
  application::ports::ILogger& log_;

  boost::asio::io_context io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_{io_.get_executor()};
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
  tcp::acceptor acceptor_{strand_};
  tcp::endpoint receiver_;

  std::mutex sessions_mtx_;
  std::vector<std::weak_ptr<RelaySession>> sessions_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
};

}  // namespace scanbridge::infrastructure::net
