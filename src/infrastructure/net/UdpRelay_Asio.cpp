#include "infrastructure/net/UdpRelay_Asio.hpp"

#include <algorithm>

#include "domain/Errors.hpp"
#include "domain/protocol/ProtocolRules.hpp"
#include "infrastructure/net/Endpoint.hpp"
#include "shared/hex/Hex.hpp"

using scanbridge::application::ports::LogLevel;
using scanbridge::application::ports::RelayDirection;
using scanbridge::domain::protocol::ProtocolRules;

namespace scanbridge::infrastructure::net
{

UdpRelay_Asio::UdpRelay_Asio(const domain::Settings& s,
                             const application::ports::IFrameCodec& codec,
                             application::ports::ILogger& log)
    : s_(s), codec_(codec), log_(log), buf_(std::max<std::size_t>(s.network.udpBuffer, 2048))
{
}

UdpRelay_Asio::~UdpRelay_Asio() { stop(); }

bool UdpRelay_Asio::start()
{
  if (running_) return true;

  boost::system::error_code ec;
  appliance_net_ = boost::asio::ip::make_network_v4(s_.relay.applianceSubnet, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[relay/udp] invalid appliance subnet '" + s_.relay.applianceSubnet + "'");
    return false;
  }

  udp::resolver resolver(io_);
  const auto hits = resolver.resolve(udp::v4(), s_.relay.receiverHost,
                                     std::to_string(s_.relay.receiverUdpPort), ec);
  if (ec || hits.empty())
  {
    log_.app(LogLevel::err, "[relay/udp] cannot resolve receiver '" + s_.relay.receiverHost +
                                "': " + ec.message());
    return false;
  }
  receiver_ = *hits.begin();

  const auto addr = boost::asio::ip::make_address_v4(s_.relay.bindAddress, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[relay/udp] invalid bind address '" + s_.relay.bindAddress + "'");
    return false;
  }

  socket_.open(udp::v4(), ec);
  if (!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
  if (!ec) socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (!ec) socket_.bind(udp::endpoint(addr, s_.relay.listenUdpPort), ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[relay/udp] bind " + s_.relay.bindAddress + ":" +
                                std::to_string(s_.relay.listenUdpPort) + " failed: " + ec.message());
    boost::system::error_code ignored;
    socket_.close(ignored);
    return false;
  }
  port_ = socket_.local_endpoint(ec).port();

  io_.restart();
  work_.emplace(boost::asio::make_work_guard(io_));
  running_ = true;
  boost::asio::post(strand_, [this] { do_receive(); });

  const int n = std::max(1, s_.network.ioThreads);
  for (int i = 0; i < n; ++i) threads_.emplace_back([this] { io_.run(); });

  log_.app(LogLevel::info, "[relay/udp] listening on " + s_.relay.bindAddress + ":" +
                               std::to_string(port_.load()) + ", appliance net " +
                               appliance_net_.to_string() + " -> receiver " + to_string(receiver_));
  return true;
}

void UdpRelay_Asio::stop()
{
  if (!running_.exchange(false)) return;

  boost::asio::post(strand_,
                    [this]
                    {
                      window_.cancel();
                      window_open_ = false;
                      boost::system::error_code ec;
                      if (socket_.is_open()) socket_.close(ec);
                      if (work_) work_->reset();
                      io_.stop();
                    });

  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();
  work_.reset();

  log_.app(LogLevel::info, "[relay/udp] stopped");
}

void UdpRelay_Asio::do_receive()
{
  socket_.async_receive_from(boost::asio::buffer(buf_), from_,
                             [this](const boost::system::error_code& ec, std::size_t n)
                             {
                               if (!running_ || ec == boost::asio::error::operation_aborted) return;
                               if (ec)
                                 log_.sock(LogLevel::warn,
                                           "[relay/udp] receive error: " + ec.message());
                               else
                                 handle(n);
                               do_receive();
                             });
}

void UdpRelay_Asio::handle(std::size_t n)
{
  const std::span<const std::byte> data(buf_.data(), n);

  // the receiver is matched on its exact endpoint before the subnet check
  if (from_ == receiver_)
  {
    if (window_open_)
      forward(data, appliance_, RelayDirection::to_appliance);
    else
      log_.sock(LogLevel::info, "[relay/udp] late receiver reply (" + std::to_string(n) +
                                    " bytes) dropped, no open window");
    return;
  }

  const auto src = from_.address();
  if (!src.is_v4() || !in_subnet(src.to_v4(), appliance_net_))
  {
    log_.sock(LogLevel::info, "[relay/udp] ignoring " + std::to_string(n) + " bytes from " +
                                  to_string(from_) + " (outside appliance net)");
    return;
  }

  // a new handshake closes the previous window first
  if (window_open_) close_window();

  appliance_ = from_;
  forward(data, receiver_, RelayDirection::to_receiver);
  open_window(data);
}

void UdpRelay_Asio::open_window(std::span<const std::byte> request)
{
  request_.assign(request.begin(), request.end());
  window_open_ = true;

  window_.expires_after(std::chrono::milliseconds(std::max(0, s_.relay.replyWindowMs)));
  window_.async_wait(
      [this](const boost::system::error_code& ec)
      {
        if (ec || !running_ || !window_open_) return;
        close_window();
      });
}

void UdpRelay_Asio::close_window()
{
  window_open_ = false;
  window_.cancel();

  if (!s_.relay.synthesizeReply) return;

  try
  {
    const auto request = codec_.decode(request_);
    const auto self_ip = advertised_address(s_.relay.advertiseIp, appliance_.address().to_v4());
    const auto reply =
        codec_.encode(ProtocolRules::reply_to(request, to_bytes(self_ip), s_.relay.name));
    forward(reply, appliance_, RelayDirection::synthesized);
  }
  catch (const domain::FormatError& e)
  {
    log_.sock(LogLevel::warn, std::string("[relay/udp] appliance datagram is not a frame (") +
                                  e.what() + "), no synthesized reply");
  }
  catch (const domain::EncodingError& e)
  {
    log_.sock(LogLevel::err, std::string("[relay/udp] cannot encode synthesized reply: ") +
                                 e.what());
  }
}

void UdpRelay_Asio::forward(std::span<const std::byte> data, const udp::endpoint& to,
                            RelayDirection dir)
{
  boost::system::error_code ec;
  socket_.send_to(boost::asio::buffer(data.data(), data.size()), to, 0, ec);
  if (ec)
  {
    log_.sock(LogLevel::warn, "[relay/udp] send to " + to_string(to) + " failed: " + ec.message());
    return;
  }

  const char* tag = dir == RelayDirection::to_receiver   ? "[relay/udp] appliance -> receiver"
                    : dir == RelayDirection::to_appliance ? "[relay/udp] receiver -> appliance"
                                                          : "[relay/udp] synthesized -> appliance";
  log_.sock(LogLevel::info, shared::hex::make_line(tag, data));

  if (on_datagram)
  {
    try
    {
      const std::string from = dir == RelayDirection::to_receiver   ? to_string(appliance_)
                               : dir == RelayDirection::to_appliance ? to_string(receiver_)
                                                                     : std::string("relay");
      on_datagram({dir, from, to_string(to), data.size()});
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err, std::string("[relay/udp] datagram callback threw: ") + e.what());
    }
    catch (...)
    {
      log_.app(LogLevel::err, "[relay/udp] datagram callback threw a non-standard exception");
    }
  }
}

}  // namespace scanbridge::infrastructure::net
