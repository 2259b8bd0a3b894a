#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace scanbridge::application::ports
{

struct RawScanInfo
{
  std::string scanType;  // black_white | grayscale | color | unknown_0xNN
  std::string quality;   // standard | medium | high | unknown_0xNN
  std::string format;    // jpg | pdf | unknown_0xNNNN
  uint16_t width{0};
  std::size_t height{0};
  std::uintmax_t fileSize{0};
  std::size_t rowSize{0};
};

struct IRawDecoder
{
  virtual ~IRawDecoder() = default;

  // Throws std::runtime_error when the file is missing or not a raw scan.
  virtual RawScanInfo inspect(const std::string& path) = 0;
};

}  // namespace scanbridge::application::ports
