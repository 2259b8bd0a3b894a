#pragma once

#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "application/ports/IListener.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IScanStore.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::infrastructure::net
{

class ReceiveSession;

// TCP accept loop. Each connection streams into its own file until the peer
// closes; retention runs after every complete receive.
class TransferReceiver_Asio final : public scanbridge::application::ports::IScanReceiver
{
 public:
  using tcp = boost::asio::ip::tcp;

  TransferReceiver_Asio(const domain::Settings& s, application::ports::IScanStore& store,
                        application::ports::ILogger& log);
  ~TransferReceiver_Asio() override;

  bool start() override;
  void stop() override;
  bool running() const override { return running_; }
  uint16_t local_port() const override { return port_; }

 private:
  friend class ReceiveSession;

  void do_accept();
  void finished(const application::ports::ReceivedScan& scan);

  const domain::Settings& s_;
  application::ports::IScanStore& store_;
  application::ports::ILogger& log_;

  boost::asio::io_context io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_{io_.get_executor()};
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
  tcp::acceptor acceptor_{strand_};

  std::mutex sessions_mtx_;
  std::vector<std::weak_ptr<ReceiveSession>> sessions_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
};

}  // namespace scanbridge::infrastructure::net
