#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "domain/protocol/ProtocolFrame.hpp"

namespace scanbridge::application::ports
{

struct DiscoveryRequest
{
  std::string localIp;
  uint16_t localPort{706};
  std::string target;  // broadcast or unicast address
  uint16_t targetPort{706};
  std::string sourceName;
  std::chrono::milliseconds timeout{10000};
  std::chrono::milliseconds pollInterval{1000};
};

struct DiscoveredAgent
{
  domain::protocol::ProtocolFrame frame;
  std::string address;  // "ip:port" of the sender
};

// ok == false only for socket-level failures. No responders is a successful,
// empty result.
struct DiscoveryResult
{
  bool ok{true};
  std::vector<DiscoveredAgent> agents;
  std::string error;
};

struct IDiscoveryClient
{
  virtual ~IDiscoveryClient() = default;
  virtual DiscoveryResult probe(const DiscoveryRequest& req) = 0;
};

}  // namespace scanbridge::application::ports
