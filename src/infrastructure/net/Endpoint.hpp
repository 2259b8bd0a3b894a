#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <string>

#include "domain/protocol/ProtocolFrame.hpp"

namespace scanbridge::infrastructure::net
{

template <class Protocol>
inline std::string to_string(const boost::asio::ip::basic_endpoint<Protocol>& ep)
{
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

inline domain::protocol::Ipv4Bytes to_bytes(const boost::asio::ip::address_v4& a)
{
  const auto b = a.to_bytes();
  return {b[0], b[1], b[2], b[3]};
}

inline bool in_subnet(const boost::asio::ip::address_v4& a, const boost::asio::ip::network_v4& net)
{
  return (a.to_uint() & net.netmask().to_uint()) == net.network().to_uint();
}

// Address this host uses to reach `peer`. A connected UDP socket is enough to
// make the kernel pick the route; nothing is sent. Falls back to `fallback`.
inline boost::asio::ip::address_v4 local_address_toward(const boost::asio::ip::address_v4& peer,
                                                        const boost::asio::ip::address_v4& fallback)
{
  boost::asio::io_context io;
  boost::asio::ip::udp::socket s(io);
  boost::system::error_code ec;
  s.open(boost::asio::ip::udp::v4(), ec);
  if (ec) return fallback;
  s.set_option(boost::asio::socket_base::broadcast(true), ec);  // peer may be a broadcast address
  s.connect(boost::asio::ip::udp::endpoint(peer, 9), ec);
  if (ec) return fallback;
  const auto local = s.local_endpoint(ec);
  if (ec || !local.address().is_v4()) return fallback;
  return local.address().to_v4();
}

// Configured address if it parses, otherwise the route toward `peer`.
inline boost::asio::ip::address_v4 advertised_address(const std::string& configured,
                                                      const boost::asio::ip::address_v4& peer)
{
  if (!configured.empty())
  {
    boost::system::error_code ec;
    auto a = boost::asio::ip::make_address_v4(configured, ec);
    if (!ec && !a.is_unspecified()) return a;
  }
  return local_address_toward(peer, boost::asio::ip::address_v4::loopback());
}

}  // namespace scanbridge::infrastructure::net
