#pragma once
#include <cstddef>
#include <span>

#include "domain/protocol/FrameLayout.hpp"
#include "domain/protocol/ProtocolFrame.hpp"

namespace scanbridge::application::ports {

  struct IFrameCodec {
    virtual ~IFrameCodec() = default;

    // Throws domain::EncodingError when a field cannot be laid out.
    virtual domain::protocol::FrameBytes encode(const domain::protocol::ProtocolFrame& frame) const = 0;

    // Throws domain::FormatError on wrong length, signature or message type.
    virtual domain::protocol::ProtocolFrame decode(std::span<const std::byte> bytes) const = 0;
  };

} // namespace scanbridge::application::ports
