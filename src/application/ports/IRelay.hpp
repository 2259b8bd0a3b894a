#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "application/ports/IListener.hpp"

namespace scanbridge::application::ports
{

// Accepted -> Connecting -> Relaying -> Closed; Connecting -> Closed on
// connect failure.
enum class RelayState
{
  accepted,
  connecting,
  relaying,
  closed
};

constexpr std::string_view to_string(RelayState s) noexcept
{
  switch (s)
  {
    case RelayState::accepted:
      return "accepted";
    case RelayState::connecting:
      return "connecting";
    case RelayState::relaying:
      return "relaying";
    case RelayState::closed:
      return "closed";
  }
  return "?";
}

struct RelaySessionStats
{
  std::string appliance;  // "ip:port"
  std::string receiver;
  std::uint64_t toReceiver{0};
  std::uint64_t toAppliance{0};
  bool relayed{false};  // reached Relaying
  RelayState state{RelayState::accepted};
  std::string error;  // first pump or connect error, empty on clean close
};

enum class RelayDirection
{
  to_receiver,
  to_appliance,
  synthesized
};

struct RelayedDatagram
{
  RelayDirection direction{RelayDirection::to_receiver};
  std::string from;
  std::string to;
  std::size_t bytes{0};
};

struct IDatagramRelay : IListener
{
  std::function<void(const RelayedDatagram&)> on_datagram;
};

struct IStreamRelay : IListener
{
  std::function<void(const RelaySessionStats&)> on_session_closed;
};

}  // namespace scanbridge::application::ports
