#include "infrastructure/net/TransferClient_Asio.hpp"

#include <algorithm>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <fstream>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/protocol/ProtocolRules.hpp"
#include "infrastructure/net/Endpoint.hpp"
#include "infrastructure/net/TimedOp.hpp"
#include "shared/hex/Hex.hpp"

using scanbridge::application::ports::LogLevel;
using scanbridge::application::ports::TransferRequest;
using scanbridge::application::ports::TransferResult;
using scanbridge::application::ports::TransferState;
using scanbridge::domain::protocol::ProtocolRules;
using tcp = boost::asio::ip::tcp;
using udp = boost::asio::ip::udp;

namespace scanbridge::infrastructure::net
{

namespace
{
bool fail(TransferResult& out, std::string why)
{
  out.ok = false;
  out.state = TransferState::failed;
  out.error = std::move(why);
  return false;
}
}  // namespace

TransferResult TransferClient_Asio::send(const TransferRequest& req)
{
  TransferResult out;

  boost::system::error_code ec;
  const auto size = boost::filesystem::file_size(req.filePath, ec);
  if (ec)
  {
    fail(out, "cannot read '" + req.filePath + "': " + ec.message());
    return out;
  }
  out.totalBytes = size;

  if (!rendezvous(req, out)) return out;
  out.state = TransferState::pending;

  if (!stream(req, out)) return out;

  out.ok = true;
  out.state = TransferState::complete;
  log_.app(LogLevel::info, "[transfer] sent " + std::to_string(out.bytesSent) + " bytes to " +
                               req.targetIp + ":" + std::to_string(req.tcpPort));
  return out;
}

// ---- UDP: probe, then wait for a reply from the target ----
bool TransferClient_Asio::rendezvous(const TransferRequest& req, TransferResult& out)
{
  boost::system::error_code ec;
  const auto local = boost::asio::ip::make_address_v4(req.localIp, ec);
  if (ec) return fail(out, "invalid local address '" + req.localIp + "'");
  const auto target = boost::asio::ip::make_address_v4(req.targetIp, ec);
  if (ec) return fail(out, "invalid target address '" + req.targetIp + "'");

  domain::protocol::FrameBytes wire;
  try
  {
    wire = codec_.encode(
        ProtocolRules::transfer_probe(to_bytes(local), req.sourceName, req.destName));
  }
  catch (const domain::EncodingError& e)
  {
    return fail(out, e.what());
  }

  boost::asio::io_context io;
  udp::socket sock(io);
  sock.open(udp::v4(), ec);
  if (!ec) sock.set_option(udp::socket::reuse_address(true), ec);
  if (!ec) sock.bind(udp::endpoint(local, req.localPort), ec);
  if (ec) return fail(out, "udp bind failed: " + ec.message());

  const udp::endpoint dest(target, req.udpPort);
  sock.send_to(boost::asio::buffer(wire), dest, 0, ec);
  if (ec) return fail(out, "udp send failed: " + ec.message());
  log_.sock(LogLevel::info, shared::hex::make_line("[transfer] probe ->", wire));

  std::vector<std::byte> buf(recv_buffer_);
  udp::endpoint from;
  const auto deadline = std::chrono::steady_clock::now() + req.udpTimeout;
  while (!out.ack)
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
      log_.sock(LogLevel::warn, "[transfer] receive error: " + r.ec.message());
      continue;
    }
    if (from.address() != dest.address())
    {
      log_.sock(LogLevel::debug, "[transfer] ignoring datagram from " + to_string(from));
      continue;
    }

    const std::span<const std::byte> datagram(buf.data(), r.bytes);
    try
    {
      out.ack = codec_.decode(datagram);
      log_.app(LogLevel::info, "[transfer] " + std::string(domain::protocol::to_string(out.ack->type)) +
                                   " reply from " + to_string(from));
    }
    catch (const domain::FormatError& e)
    {
      log_.sock(LogLevel::warn, std::string("[transfer] bad reply: ") + e.what());
      log_.sock(LogLevel::debug, shared::hex::make_line("[transfer] raw", datagram));
    }
  }

  if (!out.ack)
  {
    log_.app(LogLevel::warn, "[transfer] no reply from " + req.targetIp + " within " +
                                 std::to_string(req.udpTimeout.count()) + " ms, streaming anyway");
  }
  return true;
}

// ---- TCP: connect with timeout, stream in chunks ----
bool TransferClient_Asio::stream(const TransferRequest& req, TransferResult& out)
{
  boost::system::error_code ec;
  const tcp::endpoint dest(boost::asio::ip::make_address_v4(req.targetIp, ec), req.tcpPort);
  if (ec) return fail(out, "invalid target address '" + req.targetIp + "'");

  std::ifstream in(req.filePath, std::ios::binary);
  if (!in) return fail(out, "cannot open '" + req.filePath + "'");

  boost::asio::io_context io;
  tcp::socket sock(io);

  const auto c = run_timed(io, sock, req.tcpTimeout,
                           [&](auto handler) { sock.async_connect(dest, handler); });
  if (c.timedOut) return fail(out, "tcp connect to " + to_string(dest) + " timed out");
  if (c.ec) return fail(out, "tcp connect to " + to_string(dest) + " failed: " + c.ec.message());

  log_.sock(LogLevel::info, "[transfer] connected to " + to_string(dest));

  const std::size_t chunk = req.chunkSize > 0 ? req.chunkSize : 8192;
  std::vector<char> buf(chunk);
  while (out.bytesSent < out.totalBytes)
  {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<std::size_t>(in.gcount());
    if (n == 0) return fail(out, "file shrank while sending");

    boost::asio::write(sock, boost::asio::buffer(buf.data(), n), ec);
    if (ec) return fail(out, "tcp send failed after " + std::to_string(out.bytesSent) +
                                 " bytes: " + ec.message());
    out.bytesSent += n;
    if (req.progress) req.progress(out.bytesSent, out.totalBytes);
  }
  // completion call, also covers the empty file
  if (req.progress) req.progress(out.bytesSent, out.totalBytes);

  sock.shutdown(tcp::socket::shutdown_send, ec);
  sock.close(ec);
  return true;
}

}  // namespace scanbridge::infrastructure::net
