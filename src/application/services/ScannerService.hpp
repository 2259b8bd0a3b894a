#pragma once
#include <string>

#include "application/ports/IDiscoveryClient.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IRouteProbe.hpp"
#include "application/ports/ITransferClient.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::application::services
{

// Client role: plays the appliance against one or more agents.
class ScannerService
{
 public:
  ScannerService(ports::IDiscoveryClient& discovery, ports::ITransferClient& transfer,
                 ports::IRouteProbe& route, ports::ILogger& logger, const domain::Settings& s)
      : discovery_(discovery), transfer_(transfer), route_(route), log_(logger), cfg_(s)
  {
  }

  ports::DiscoveryResult discover();

  // Empty `dest_name` sends without addressing a specific agent name.
  ports::TransferResult send(const std::string& target, const std::string& file,
                             const std::string& dest_name = {},
                             ports::ProgressCallback progress = {});

 private:
  std::string local_ip_for(const std::string& peer);

  ports::IDiscoveryClient& discovery_;
  ports::ITransferClient& transfer_;
  ports::IRouteProbe& route_;
  ports::ILogger& log_;
  const domain::Settings& cfg_;
};

}  // namespace scanbridge::application::services
