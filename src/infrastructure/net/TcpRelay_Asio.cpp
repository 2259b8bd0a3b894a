#include "infrastructure/net/TcpRelay_Asio.hpp"

#include <algorithm>

#include "infrastructure/net/Endpoint.hpp"

using scanbridge::application::ports::LogLevel;
using scanbridge::application::ports::RelaySessionStats;
using scanbridge::application::ports::RelayState;

namespace scanbridge::infrastructure::net
{

// -----------------------------------------------------------------------------
// RelaySession
//  - Accepted -> Connecting -> Relaying -> Closed
//  - two pumps on one strand; EOF on a source half-closes its destination
//  - any other pump error closes both sockets
// -----------------------------------------------------------------------------
class RelaySession : public std::enable_shared_from_this<RelaySession>
{
 public:
  using tcp = boost::asio::ip::tcp;

  RelaySession(TcpRelay_Asio& owner, tcp::socket appliance)
      : owner_(owner),
        appliance_(std::move(appliance)),
        receiver_(appliance_.get_executor()),
        timer_(appliance_.get_executor()),
        a2r_(std::max<std::size_t>(owner.s_.relay.pumpBuffer, 512)),
        r2a_(a2r_.size())
  {
  }

  tcp::socket::executor_type executor() { return appliance_.get_executor(); }

  void start()
  {
    if (st_.state == RelayState::closed) return;

    boost::system::error_code ec;
    const auto peer = appliance_.remote_endpoint(ec);
    st_.appliance = ec ? std::string("?") : to_string(peer);
    st_.receiver = to_string(owner_.receiver_);

    st_.state = RelayState::connecting;
    owner_.log_.sock(LogLevel::info,
                     "[relay/tcp] " + st_.appliance + " accepted, connecting " + st_.receiver);

    timer_.expires_after(
        std::chrono::milliseconds(std::max(1, owner_.s_.network.tcpConnectTimeoutMs)));
    timer_.async_wait(
        [self = shared_from_this()](const boost::system::error_code& e)
        {
          if (e || self->st_.state != RelayState::connecting) return;
          self->timed_out_ = true;
          boost::system::error_code ignored;
          self->receiver_.close(ignored);
        });

    receiver_.async_connect(owner_.receiver_,
                            [self = shared_from_this()](const boost::system::error_code& e)
                            { self->on_connect(e); });
  }

  // any thread
  void close()
  {
    boost::asio::post(executor(),
                      [self = shared_from_this()]
                      {
                        self->fail("relay stopping");
                      });
  }

 private:
  struct Pump
  {
    tcp::socket* src;
    tcp::socket* dst;
    std::vector<std::byte>* buf;
    std::uint64_t* counter;
    const char* label;
  };

  void on_connect(const boost::system::error_code& ec)
  {
    timer_.cancel();
    if (st_.state != RelayState::connecting) return;

    if (ec)
    {
      st_.error = timed_out_ ? std::string("connect timed out") : "connect failed: " + ec.message();
      close_both();
      return;
    }

    st_.state = RelayState::relaying;
    st_.relayed = true;
    owner_.log_.sock(LogLevel::info,
                     "[relay/tcp] relaying " + st_.appliance + " <-> " + st_.receiver);

    read(Pump{&appliance_, &receiver_, &a2r_, &st_.toReceiver, "appliance -> receiver"});
    read(Pump{&receiver_, &appliance_, &r2a_, &st_.toAppliance, "receiver -> appliance"});
  }

  void read(Pump p)
  {
    p.src->async_read_some(
        boost::asio::buffer(*p.buf),
        [self = shared_from_this(), p](const boost::system::error_code& ec, std::size_t n)
        {
          if (n > 0)
          {
            self->write(p, n, ec);
            return;
          }
          self->end_of_read(p, ec);
        });
  }

  // pending read error is handled once the bytes it came with are written
  void write(Pump p, std::size_t n, boost::system::error_code read_ec)
  {
    boost::asio::async_write(
        *p.dst, boost::asio::buffer(p.buf->data(), n),
        [self = shared_from_this(), p, read_ec](const boost::system::error_code& ec,
                                                 std::size_t written)
        {
          if (ec)
          {
            self->pump_failed(p, ec);
            return;
          }
          *p.counter += written;
          self->owner_.log_.sock(LogLevel::trace, std::string("[relay/tcp] ") + p.label + " " +
                                                      std::to_string(written) + " bytes");
          if (read_ec)
            self->end_of_read(p, read_ec);
          else
            self->read(p);
        });
  }

  void end_of_read(Pump p, const boost::system::error_code& ec)
  {
    if (ec && ec != boost::asio::error::eof)
    {
      pump_failed(p, ec);
      return;
    }

    // half-close: the other direction keeps draining
    boost::system::error_code ignored;
    p.dst->shutdown(tcp::socket::shutdown_send, ignored);
    owner_.log_.sock(LogLevel::debug, std::string("[relay/tcp] ") + p.label + " reached EOF");
    pump_done();
  }

  void pump_failed(Pump p, const boost::system::error_code& ec)
  {
    if (st_.error.empty() && ec != boost::asio::error::operation_aborted)
      st_.error = std::string(p.label) + ": " + ec.message();
    close_both();
    pump_done();
  }

  void fail(const std::string& why)
  {
    if (st_.state == RelayState::closed) return;
    if (st_.error.empty()) st_.error = why;
    timer_.cancel();
    if (st_.state == RelayState::relaying)
    {
      // the pumps observe the closed sockets and finish the session
      boost::system::error_code ignored;
      appliance_.close(ignored);
      receiver_.close(ignored);
      return;
    }
    close_both();
  }

  void pump_done()
  {
    if (++pumps_done_ == 2) close_both();
  }

  void close_both()
  {
    boost::system::error_code ignored;
    appliance_.close(ignored);
    receiver_.close(ignored);

    // Relaying sessions report only after both pumps ended
    if (st_.state == RelayState::relaying && pumps_done_ < 2) return;
    if (st_.state == RelayState::closed) return;

    st_.state = RelayState::closed;
    owner_.finished(st_);
  }

  TcpRelay_Asio& owner_;
  tcp::socket appliance_;
  tcp::socket receiver_;
  boost::asio::steady_timer timer_;
  std::vector<std::byte> a2r_;
  std::vector<std::byte> r2a_;
  RelaySessionStats st_;
  int pumps_done_{0};
  bool timed_out_{false};
};

// -------------------- TcpRelay_Asio --------------------
TcpRelay_Asio::TcpRelay_Asio(const domain::Settings& s, application::ports::ILogger& log)
    : s_(s), log_(log)
{
}

TcpRelay_Asio::~TcpRelay_Asio() { stop(); }

bool TcpRelay_Asio::start()
{
  if (running_) return true;

  boost::system::error_code ec;
  tcp::resolver resolver(io_);
  const auto hits = resolver.resolve(tcp::v4(), s_.relay.receiverHost,
                                     std::to_string(s_.relay.receiverTcpPort), ec);
  if (ec || hits.empty())
  {
    log_.app(LogLevel::err, "[relay/tcp] cannot resolve receiver '" + s_.relay.receiverHost +
                                "': " + ec.message());
    return false;
  }
  receiver_ = *hits.begin();

  const auto addr = boost::asio::ip::make_address_v4(s_.relay.bindAddress, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[relay/tcp] invalid bind address '" + s_.relay.bindAddress + "'");
    return false;
  }

  const tcp::endpoint ep(addr, s_.relay.listenTcpPort);
  acceptor_.open(ep.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(ep, ec);
  if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[relay/tcp] listen " + to_string(ep) + " failed: " + ec.message());
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

  log_.app(LogLevel::info, "[relay/tcp] listening on " + s_.relay.bindAddress + ":" +
                               std::to_string(port_.load()) + " -> receiver " +
                               to_string(receiver_));
  return true;
}

void TcpRelay_Asio::stop()
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

  work_.reset();
  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();

  log_.app(LogLevel::info, "[relay/tcp] stopped");
}

void TcpRelay_Asio::do_accept()
{
  acceptor_.async_accept(
      boost::asio::make_strand(io_),
      [this](const boost::system::error_code& ec, tcp::socket socket)
      {
        if (!running_ || ec == boost::asio::error::operation_aborted) return;
        if (ec)
        {
          log_.sock(LogLevel::warn, "[relay/tcp] accept error: " + ec.message());
        }
        else
        {
          auto session = std::make_shared<RelaySession>(*this, std::move(socket));
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

void TcpRelay_Asio::finished(const RelaySessionStats& st)
{
  const auto level = st.error.empty() ? LogLevel::info : LogLevel::warn;
  log_.app(level, "[relay/tcp] session " + st.appliance + " closed: " +
                      std::to_string(st.toReceiver) + " bytes to receiver, " +
                      std::to_string(st.toAppliance) + " bytes to appliance" +
                      (st.relayed ? "" : ", never relayed") +
                      (st.error.empty() ? std::string() : " (" + st.error + ")"));

  if (on_session_closed)
  {
    try
    {
      on_session_closed(st);
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err, std::string("[relay/tcp] session callback threw: ") + e.what());
    }
    catch (...)
    {
      log_.app(LogLevel::err, "[relay/tcp] session callback threw a non-standard exception");
    }
  }
}

}  // namespace scanbridge::infrastructure::net
