#pragma once

#include <cstdint>
#include <string>

#include "application/ports/IRawDecoder.hpp"

namespace scanbridge::infrastructure::decoder
{

// Reads only the 16-byte header and counts row markers. Pixel extraction and
// image emission live elsewhere.
class RawDecoder_Header final : public scanbridge::application::ports::IRawDecoder
{
 public:
  static constexpr std::size_t kHeaderSize = 16;

  application::ports::RawScanInfo inspect(const std::string& path) override;

  static std::string scan_type_name(uint8_t b);
  static std::string quality_name(uint8_t b);
  static std::string format_name(uint8_t b0, uint8_t b1);
};

}  // namespace scanbridge::infrastructure::decoder
