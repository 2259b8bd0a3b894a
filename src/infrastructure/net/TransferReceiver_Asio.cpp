#include "infrastructure/net/TransferReceiver_Asio.hpp"

#include <algorithm>
#include <fstream>

#include "infrastructure/net/Endpoint.hpp"

using scanbridge::application::ports::LogLevel;
using scanbridge::application::ports::ReceivedScan;

namespace scanbridge::infrastructure::net
{

// -----------------------------------------------------------------------------
// ReceiveSession
//  - one accepted connection, bound to its own strand
//  - appends every chunk to the file; EOF is the completion signal
//  - optional idle timer closes a sender that stalls
// -----------------------------------------------------------------------------
class ReceiveSession : public std::enable_shared_from_this<ReceiveSession>
{
 public:
  using tcp = boost::asio::ip::tcp;

  ReceiveSession(TransferReceiver_Asio& owner, tcp::socket socket)
      : owner_(owner),
        socket_(std::move(socket)),
        idle_(socket_.get_executor()),
        buf_(std::max<std::size_t>(owner.s_.network.tcpRecvBuffer, 512))
  {
  }

  void start()
  {
    boost::system::error_code ec;
    const auto peer = socket_.remote_endpoint(ec);
    scan_.peer = ec ? std::string("?") : to_string(peer);

    try
    {
      scan_.path = owner_.store_.allocate(ec ? std::string("unknown") : peer.address().to_string());
    }
    catch (const std::exception& e)
    {
      finish(std::string("cannot allocate output file: ") + e.what());
      return;
    }

    out_.open(scan_.path, std::ios::binary | std::ios::trunc);
    if (!out_)
    {
      finish("cannot open " + scan_.path);
      return;
    }

    owner_.log_.sock(LogLevel::info,
                     "[receiver] " + scan_.peer + " connected, writing " + scan_.path);
    do_read();
  }

  tcp::socket::executor_type executor() { return socket_.get_executor(); }

  // any thread
  void close()
  {
    boost::asio::post(socket_.get_executor(),
                      [self = shared_from_this()]
                      {
                        boost::system::error_code ec;
                        self->socket_.close(ec);
                      });
  }

 private:
  void do_read()
  {
    arm_idle();
    socket_.async_read_some(boost::asio::buffer(buf_),
                            [self = shared_from_this()](const boost::system::error_code& ec,
                                                        std::size_t n)
                            { self->on_read(ec, n); });
  }

  void on_read(const boost::system::error_code& ec, std::size_t n)
  {
    if (n > 0)
    {
      out_.write(reinterpret_cast<const char*>(buf_.data()), static_cast<std::streamsize>(n));
      if (!out_)
      {
        finish("write to " + scan_.path + " failed");
        return;
      }
      scan_.bytes += n;
    }

    if (ec == boost::asio::error::eof)
    {
      scan_.complete = true;
      finish({});
      return;
    }
    if (ec)
    {
      finish(timed_out_ ? std::string("idle timeout") : ec.message());
      return;
    }
    do_read();
  }

  void arm_idle()
  {
    const int ms = owner_.s_.network.readIdleTimeoutMs;
    if (ms <= 0) return;

    idle_.expires_after(std::chrono::milliseconds(ms));
    idle_.async_wait(
        [self = shared_from_this()](const boost::system::error_code& ec)
        {
          if (ec) return;
          self->timed_out_ = true;
          boost::system::error_code ignored;
          self->socket_.close(ignored);
        });
  }

  void finish(std::string error)
  {
    if (done_) return;
    done_ = true;

    idle_.cancel();
    if (out_.is_open()) out_.close();
    boost::system::error_code ec;
    socket_.close(ec);

    scan_.error = std::move(error);
    owner_.finished(scan_);
  }

  TransferReceiver_Asio& owner_;
  tcp::socket socket_;
  boost::asio::steady_timer idle_;
  std::vector<std::byte> buf_;
  std::ofstream out_;
  ReceivedScan scan_;
  bool timed_out_{false};
  bool done_{false};
};

// -------------------- TransferReceiver_Asio --------------------
TransferReceiver_Asio::TransferReceiver_Asio(const domain::Settings& s,
                                             application::ports::IScanStore& store,
                                             application::ports::ILogger& log)
    : s_(s), store_(store), log_(log)
{
}

TransferReceiver_Asio::~TransferReceiver_Asio() { stop(); }

bool TransferReceiver_Asio::start()
{
  if (running_) return true;

  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address_v4(s_.agent.bindAddress, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[receiver] invalid bind address '" + s_.agent.bindAddress + "'");
    return false;
  }

  const tcp::endpoint ep(addr, s_.network.tcpPort);
  acceptor_.open(ep.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(ep, ec);
  if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[receiver] listen tcp " + to_string(ep) + " failed: " + ec.message());
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }
  port_ = acceptor_.local_endpoint(ec).port();

  io_.restart();
  work_.emplace(boost::asio::make_work_guard(io_));
  running_ = true;
  boost::asio::post(strand_, [this] { do_accept(); });

  const int n = std::max(1, s_.network.ioThreads);
  for (int i = 0; i < n; ++i) threads_.emplace_back([this] { io_.run(); });

  log_.app(LogLevel::info, "[receiver] listening on tcp " + s_.agent.bindAddress + ":" +
                               std::to_string(port_.load()) + ", storing in " +
                               s_.agent.storageDir);
  return true;
}

void TransferReceiver_Asio::stop()
{
  if (!running_.exchange(false)) return;

  boost::asio::post(strand_,
                    [this]
                    {
                      boost::system::error_code ec;
                      if (acceptor_.is_open()) acceptor_.close(ec);
                    });

  {
    std::lock_guard<std::mutex> lk(sessions_mtx_);
    for (auto& w : sessions_)
      if (auto sp = w.lock()) sp->close();
    sessions_.clear();
  }

  // sessions drain (partial files are reported), then run() returns
  work_.reset();
  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();

  log_.app(LogLevel::info, "[receiver] stopped");
}

void TransferReceiver_Asio::do_accept()
{
  acceptor_.async_accept(
      boost::asio::make_strand(io_),
      [this](const boost::system::error_code& ec, tcp::socket socket)
      {
        if (!running_ || ec == boost::asio::error::operation_aborted) return;
        if (ec)
        {
          log_.sock(LogLevel::warn, "[receiver] accept error: " + ec.message());
        }
        else
        {
          auto session = std::make_shared<ReceiveSession>(*this, std::move(socket));
          {
            std::lock_guard<std::mutex> lk(sessions_mtx_);
            sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                           [](const auto& w) { return w.expired(); }),
                            sessions_.end());
            sessions_.push_back(session);
          }
          boost::asio::dispatch(session->executor(), [session] { session->start(); });
        }
        do_accept();
      });
}

void TransferReceiver_Asio::finished(const ReceivedScan& scan)
{
  if (scan.complete)
  {
    log_.app(LogLevel::info, "[receiver] received " + std::to_string(scan.bytes) + " bytes from " +
                                 scan.peer + " -> " + scan.path);
    store_.enforce_retention();
  }
  else
  {
    log_.app(LogLevel::warn, "[receiver] transfer from " + scan.peer + " ended early after " +
                                 std::to_string(scan.bytes) + " bytes: " + scan.error +
                                 (scan.path.empty() ? std::string() : ", partial file kept"));
  }

  if (on_complete)
  {
    try
    {
      on_complete(scan);
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err, std::string("[receiver] completion callback threw: ") + e.what());
    }
    catch (...)
    {
      log_.app(LogLevel::err, "[receiver] completion callback threw a non-standard exception");
    }
  }
}

}  // namespace scanbridge::infrastructure::net
