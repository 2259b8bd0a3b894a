#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace scanbridge::domain::protocol
{

// Fixed 90-byte frame, fields in wire order:
//   signature(3) type(3) reserved1(6) initiatorIP(4) reserved2(4)
//   srcName(20) dstName(40) reserved3(10)
namespace layout
{
inline constexpr std::size_t kSignatureOff = 0;
inline constexpr std::size_t kTypeOff = 3;
inline constexpr std::size_t kReserved1Off = 6;
inline constexpr std::size_t kInitiatorIpOff = 12;
inline constexpr std::size_t kReserved2Off = 16;
inline constexpr std::size_t kSrcNameOff = 20;
inline constexpr std::size_t kDstNameOff = 40;
inline constexpr std::size_t kReserved3Off = 80;

inline constexpr std::size_t kSignatureSize = 3;
inline constexpr std::size_t kTypeSize = 3;
inline constexpr std::size_t kReserved1Size = 6;
inline constexpr std::size_t kIpSize = 4;
inline constexpr std::size_t kReserved2Size = 4;
inline constexpr std::size_t kSrcNameSize = 20;
inline constexpr std::size_t kDstNameSize = 40;
inline constexpr std::size_t kReserved3Size = 10;

inline constexpr std::size_t kFrameSize = 90;

static_assert(kReserved3Off + kReserved3Size == kFrameSize, "frame layout must span 90 bytes");
}  // namespace layout

using FrameBytes = std::array<std::byte, layout::kFrameSize>;

// Three-byte code, e.g. 0x5A 0x54 0x00
struct Code3
{
  uint8_t a;
  uint8_t b;
  uint8_t c;

  constexpr bool matches(std::span<const std::byte> buf) const noexcept
  {
    return buf.size() >= 3 && std::to_integer<uint8_t>(buf[0]) == a &&
           std::to_integer<uint8_t>(buf[1]) == b && std::to_integer<uint8_t>(buf[2]) == c;
  }
};

// ---- Canonical constants ----
inline constexpr Code3 kSignature{0x55, 0x00, 0x00};
inline constexpr Code3 kDiscoveryCode{0x5A, 0x00, 0x00};
inline constexpr Code3 kFileTransferCode{0x5A, 0x54, 0x00};

// Responder-originated frames carry these; the appliance checks them.
inline constexpr std::array<uint8_t, layout::kReserved1Size> kVendorReserved1{0x00, 0x09, 0xB9,
                                                                             0x00, 0x2C, 0x84};
inline constexpr std::array<uint8_t, layout::kReserved2Size> kVendorReserved2{0x00, 0x00, 0x02,
                                                                             0xC4};

enum class MessageType
{
  discovery,
  file_transfer
};

constexpr Code3 code_of(MessageType t) noexcept
{
  return t == MessageType::discovery ? kDiscoveryCode : kFileTransferCode;
}

constexpr std::string_view to_string(MessageType t) noexcept
{
  return t == MessageType::discovery ? "discovery" : "file-transfer";
}

}  // namespace scanbridge::domain::protocol
