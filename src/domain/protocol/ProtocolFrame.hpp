#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "domain/protocol/FrameLayout.hpp"

namespace scanbridge::domain::protocol
{

using Ipv4Bytes = std::array<uint8_t, layout::kIpSize>;

// Structured view of one frame. The signature is implied; reserved fields are
// carried verbatim so replies can regenerate them bit-for-bit.
struct ProtocolFrame
{
  MessageType type{MessageType::discovery};
  std::array<uint8_t, layout::kReserved1Size> reserved1{};
  Ipv4Bytes initiatorIp{};
  std::array<uint8_t, layout::kReserved2Size> reserved2{};
  std::string srcName;  // without padding
  std::string dstName;  // without padding
  std::array<uint8_t, layout::kReserved3Size> reserved3{};

  bool operator==(const ProtocolFrame&) const = default;
};

inline std::string format_ipv4(const Ipv4Bytes& ip)
{
  return std::to_string(ip[0]) + "." + std::to_string(ip[1]) + "." + std::to_string(ip[2]) + "." +
         std::to_string(ip[3]);
}

}  // namespace scanbridge::domain::protocol
