#pragma once

#include "application/ports/IRouteProbe.hpp"
#include "infrastructure/net/Endpoint.hpp"

namespace scanbridge::infrastructure::net
{

class RouteProbe_Udp final : public scanbridge::application::ports::IRouteProbe
{
 public:
  // Unparsable peers (host names) resolve through the default route.
  std::string local_address_for(const std::string& peer) override
  {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(peer, ec);
    if (ec || addr.is_unspecified()) addr = boost::asio::ip::make_address_v4("8.8.8.8");
    return local_address_toward(addr, boost::asio::ip::address_v4::loopback()).to_string();
  }
};

}  // namespace scanbridge::infrastructure::net
