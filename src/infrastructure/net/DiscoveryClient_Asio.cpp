#include "infrastructure/net/DiscoveryClient_Asio.hpp"

#include <algorithm>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/protocol/ProtocolRules.hpp"
#include "infrastructure/net/Endpoint.hpp"
#include "infrastructure/net/TimedOp.hpp"
#include "shared/hex/Hex.hpp"

using scanbridge::application::ports::DiscoveredAgent;
using scanbridge::application::ports::DiscoveryRequest;
using scanbridge::application::ports::DiscoveryResult;
using scanbridge::application::ports::LogLevel;
using scanbridge::domain::protocol::ProtocolRules;
using udp = boost::asio::ip::udp;

namespace scanbridge::infrastructure::net
{

namespace
{
DiscoveryResult failed(std::string why)
{
  DiscoveryResult r;
  r.ok = false;
  r.error = std::move(why);
  return r;
}
}  // namespace

DiscoveryResult DiscoveryClient_Asio::probe(const DiscoveryRequest& req)
{
  boost::system::error_code ec;

  const auto local = boost::asio::ip::make_address_v4(req.localIp, ec);
  if (ec) return failed("invalid local address '" + req.localIp + "'");
  const auto target = boost::asio::ip::make_address_v4(req.target, ec);
  if (ec) return failed("invalid target address '" + req.target + "'");

  domain::protocol::FrameBytes wire;
  try
  {
    wire = codec_.encode(ProtocolRules::discovery_probe(to_bytes(local), req.sourceName));
  }
  catch (const domain::EncodingError& e)
  {
    return failed(e.what());
  }

  boost::asio::io_context io;
  udp::socket sock(io);  // closed by its destructor on every path

  sock.open(udp::v4(), ec);
  if (!ec) sock.set_option(udp::socket::reuse_address(true), ec);
  if (!ec) sock.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (!ec) sock.bind(udp::endpoint(local, req.localPort), ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[discovery] bind " + req.localIp + ":" +
                                std::to_string(req.localPort) + " failed: " + ec.message());
    return failed("bind failed: " + ec.message());
  }

  const udp::endpoint dest(target, req.targetPort);
  sock.send_to(boost::asio::buffer(wire), dest, 0, ec);
  if (ec)
  {
    log_.app(LogLevel::err, "[discovery] send to " + to_string(dest) + " failed: " + ec.message());
    return failed("send failed: " + ec.message());
  }

  const udp::endpoint self = sock.local_endpoint(ec);
  log_.sock(LogLevel::info, shared::hex::make_line("[discovery] probe ->", wire));
  log_.app(LogLevel::info, "[discovery] probe sent to " + to_string(dest) + ", listening for " +
                               std::to_string(req.timeout.count()) + " ms");

  DiscoveryResult result;
  std::vector<std::byte> buf(recv_buffer_);
  udp::endpoint from;

  const auto deadline = std::chrono::steady_clock::now() + req.timeout;
  for (;;)
  {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    const auto wait =
        std::min<std::chrono::steady_clock::duration>(req.pollInterval, deadline - now);

    const auto r = run_timed(io, sock, wait,
                             [&](auto handler)
                             { sock.async_receive_from(boost::asio::buffer(buf), from, handler); });
    if (r.timedOut) continue;
    if (r.ec)
    {
      log_.sock(LogLevel::warn, "[discovery] receive error: " + r.ec.message());
      continue;
    }

    // our own broadcast comes back when we listen on the same port
    if (from == self) continue;

    const std::span<const std::byte> datagram(buf.data(), r.bytes);
    try
    {
      DiscoveredAgent agent{codec_.decode(datagram), to_string(from)};
      log_.app(LogLevel::info, "[discovery] reply from " + agent.address + " name='" +
                                   agent.frame.dstName + "'");
      result.agents.push_back(std::move(agent));
    }
    catch (const domain::FormatError& e)
    {
      log_.sock(LogLevel::warn, std::string("[discovery] skipping datagram from ") +
                                    to_string(from) + ": " + e.what());
      log_.sock(LogLevel::debug, shared::hex::make_line("[discovery] raw", datagram));
    }
  }

  log_.app(LogLevel::info,
           "[discovery] done, " + std::to_string(result.agents.size()) + " responder(s)");
  return result;
}

}  // namespace scanbridge::infrastructure::net
