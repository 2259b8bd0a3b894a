#include "infrastructure/net/FrameResponder_Asio.hpp"

#include <algorithm>

#include "domain/Errors.hpp"
#include "domain/protocol/ProtocolRules.hpp"
#include "infrastructure/net/Endpoint.hpp"
#include "shared/hex/Hex.hpp"

using scanbridge::application::ports::LogLevel;
using scanbridge::domain::protocol::ProtocolRules;

namespace scanbridge::infrastructure::net
{

FrameResponder_Asio::FrameResponder_Asio(const domain::Settings& s,
                                         const application::ports::IFrameCodec& codec,
                                         application::ports::ILogger& log)
    : s_(s), codec_(codec), log_(log), buf_(std::max<std::size_t>(s.network.udpBuffer, 128))
{
}

FrameResponder_Asio::~FrameResponder_Asio() { stop(); }

bool FrameResponder_Asio::start()
{
  if (running_) return true;

  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address_v4(s_.agent.bindAddress, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[responder] invalid bind address '" + s_.agent.bindAddress + "'");
    return false;
  }

  socket_.open(udp::v4(), ec);
  if (!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
  if (!ec) socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (!ec) socket_.bind(udp::endpoint(addr, s_.network.udpPort), ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[responder] bind udp " + s_.agent.bindAddress + ":" +
                                std::to_string(s_.network.udpPort) + " failed: " + ec.message());
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

  log_.app(LogLevel::info, "[responder] listening on udp " + s_.agent.bindAddress + ":" +
                               std::to_string(port_.load()) + " as '" + s_.agent.name + "'");
  return true;
}

void FrameResponder_Asio::stop()
{
  if (!running_.exchange(false)) return;

  boost::asio::post(strand_,
                    [this]
                    {
                      boost::system::error_code ec;
                      if (socket_.is_open()) socket_.close(ec);
                      if (work_) work_->reset();
                      io_.stop();
                    });

  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();
  work_.reset();

  log_.app(LogLevel::info, "[responder] stopped");
}

void FrameResponder_Asio::do_receive()
{
  socket_.async_receive_from(boost::asio::buffer(buf_), from_,
                             [this](const boost::system::error_code& ec, std::size_t n)
                             {
                               if (!running_ || ec == boost::asio::error::operation_aborted) return;
                               if (ec)
                               {
                                 log_.sock(LogLevel::warn,
                                           "[responder] receive error: " + ec.message());
                               }
                               else
                               {
                                 handle(n);
                               }
                               do_receive();
                             });
}

void FrameResponder_Asio::handle(std::size_t n)
{
  const std::span<const std::byte> datagram(buf_.data(), n);
  const std::string sender = to_string(from_);

  domain::protocol::ProtocolFrame request;
  try
  {
    request = codec_.decode(datagram);
  }
  catch (const domain::FormatError& e)
  {
    log_.sock(LogLevel::warn, "[responder] dropping datagram from " + sender + ": " + e.what());
    log_.sock(LogLevel::debug, shared::hex::make_line("[responder] raw", datagram));
    return;
  }

  log_.sock(LogLevel::info, "[responder] " + std::string(domain::protocol::to_string(request.type)) +
                                " probe from " + sender + " src='" + request.srcName +
                                "' r1=" + shared::hex::to_hex(request.reserved1));

  const auto self_ip = advertised_address(s_.agent.advertiseIp, from_.address().to_v4());
  try
  {
    const auto reply =
        codec_.encode(ProtocolRules::reply_to(request, to_bytes(self_ip), s_.agent.name));
    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(reply), from_, 0, ec);
    if (ec)
      log_.sock(LogLevel::warn, "[responder] reply to " + sender + " failed: " + ec.message());
    else
      log_.sock(LogLevel::debug, shared::hex::make_line("[responder] reply ->", reply));
  }
  catch (const domain::EncodingError& e)
  {
    log_.sock(LogLevel::err, std::string("[responder] cannot encode reply: ") + e.what());
  }

  if (on_frame)
  {
    try
    {
      on_frame(request, sender);
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err, std::string("[responder] frame callback threw: ") + e.what());
    }
    catch (...)
    {
      log_.app(LogLevel::err, "[responder] frame callback threw a non-standard exception");
    }
  }
}

}  // namespace scanbridge::infrastructure::net
