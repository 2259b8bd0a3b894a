#include "application/services/ScannerService.hpp"

#include <chrono>

using scanbridge::application::ports::LogLevel;

namespace scanbridge::application::services
{

std::string ScannerService::local_ip_for(const std::string& peer)
{
  if (!cfg_.scanner.localIp.empty()) return cfg_.scanner.localIp;

  auto ip = route_.local_address_for(peer);
  log_.app(LogLevel::debug, "Local address toward " + peer + " is " + ip);
  return ip;
}

ports::DiscoveryResult ScannerService::discover()
{
  ports::DiscoveryRequest req;
  req.localIp = local_ip_for(cfg_.scanner.broadcast);
  req.localPort = cfg_.scanner.localPort;
  req.target = cfg_.scanner.broadcast;
  req.targetPort = cfg_.network.udpPort;
  req.sourceName = cfg_.scanner.name;
  req.timeout = std::chrono::milliseconds(cfg_.network.discoveryTimeoutMs);
  req.pollInterval = std::chrono::milliseconds(cfg_.network.socketTimeoutMs);

  auto res = discovery_.probe(req);
  if (!res.ok) log_.app(LogLevel::err, "Discovery failed: " + res.error);
  return res;
}

ports::TransferResult ScannerService::send(const std::string& target, const std::string& file,
                                           const std::string& dest_name,
                                           ports::ProgressCallback progress)
{
  ports::TransferRequest req;
  req.localIp = local_ip_for(target);
  req.localPort = cfg_.scanner.localPort;
  req.targetIp = target;
  req.udpPort = cfg_.network.udpPort;
  req.tcpPort = cfg_.network.tcpPort;
  req.sourceName = cfg_.scanner.name;
  req.destName = dest_name;
  req.filePath = file.empty() ? cfg_.scanner.defaultFile : file;
  req.udpTimeout = std::chrono::milliseconds(cfg_.network.udpTimeoutMs);
  req.tcpTimeout = std::chrono::milliseconds(cfg_.network.tcpConnectTimeoutMs);
  req.pollInterval = std::chrono::milliseconds(cfg_.network.socketTimeoutMs);
  req.chunkSize = cfg_.network.tcpChunkSize;
  req.progress = std::move(progress);

  auto res = transfer_.send(req);
  if (!res.ok) log_.app(LogLevel::err, "Transfer to " + target + " failed: " + res.error);
  return res;
}

}  // namespace scanbridge::application::services
