#pragma once
#include <string>

namespace scanbridge::application::ports
{

// Which local IPv4 address does this host use to reach `peer`?
struct IRouteProbe
{
  virtual ~IRouteProbe() = default;
  virtual std::string local_address_for(const std::string& peer) = 0;
};

}  // namespace scanbridge::application::ports
