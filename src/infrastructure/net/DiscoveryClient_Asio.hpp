#pragma once

#include <cstddef>

#include "application/ports/IDiscoveryClient.hpp"
#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ILogger.hpp"

namespace scanbridge::infrastructure::net
{

// One broadcast (or unicast) probe, then collect replies until the window
// closes. Every call owns its socket; nothing survives between calls.
class DiscoveryClient_Asio final : public scanbridge::application::ports::IDiscoveryClient
{
 public:
  DiscoveryClient_Asio(const application::ports::IFrameCodec& codec,
                       application::ports::ILogger& log, std::size_t recv_buffer = 1024)
      : codec_(codec), log_(log), recv_buffer_(recv_buffer)
  {
  }

  application::ports::DiscoveryResult probe(const application::ports::DiscoveryRequest& req) override;

 private:
  const application::ports::IFrameCodec& codec_;
  application::ports::ILogger& log_;
  std::size_t recv_buffer_;
};

}  // namespace scanbridge::infrastructure::net
