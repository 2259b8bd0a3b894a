#pragma once
#include <string_view>

#include "application/ports/IFrameCodec.hpp"

namespace scanbridge::infrastructure::codec
{

// Byte-exact codec for the appliance frame. Name fields are ASCII,
// right-padded with zeros; values that do not fit are rejected, never
// truncated.
class FrameCodec_Scanner final : public scanbridge::application::ports::IFrameCodec
{
 public:
  domain::protocol::FrameBytes encode(const domain::protocol::ProtocolFrame& frame) const override;
  domain::protocol::ProtocolFrame decode(std::span<const std::byte> bytes) const override;

  // Validation used by encode(); exposed so callers can check a configured
  // name once at startup.
  static void check_name(std::string_view value, std::size_t width, const char* field);
};

}  // namespace scanbridge::infrastructure::codec
