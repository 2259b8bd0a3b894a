#include "infrastructure/decoder/RawDecoder_Header.hpp"

#include <boost/filesystem.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace fs = boost::filesystem;

namespace scanbridge::infrastructure::decoder
{

namespace
{
std::string unknown(unsigned v, int digits)
{
  char b[16];
  std::snprintf(b, sizeof(b), "unknown_0x%0*X", digits, v);
  return b;
}
}  // namespace

std::string RawDecoder_Header::scan_type_name(uint8_t b)
{
  switch (b)
  {
    case 'B':
      return "black_white";
    case 'G':
      return "grayscale";
    case 'R':
      return "color";
    default:
      return unknown(b, 2);
  }
}

std::string RawDecoder_Header::quality_name(uint8_t b)
{
  switch (b)
  {
    case 0x32:
      return "standard";
    case 0x33:
      return "medium";
    case 0x36:
      return "high";
    default:
      return unknown(b, 2);
  }
}

std::string RawDecoder_Header::format_name(uint8_t b0, uint8_t b1)
{
  if (b0 == 'J' && b1 == 'P') return "jpg";
  if (b0 == 'P' && b1 == 'D') return "pdf";
  return unknown((static_cast<unsigned>(b0) << 8) | b1, 4);
}

application::ports::RawScanInfo RawDecoder_Header::inspect(const std::string& path)
{
  boost::system::error_code ec;
  if (!fs::is_regular_file(path, ec)) throw std::runtime_error("raw file not found: " + path);

  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open raw file: " + path);

  const std::vector<uint8_t> data{std::istreambuf_iterator<char>(in),
                                  std::istreambuf_iterator<char>()};
  if (data.size() < kHeaderSize)
  {
    throw std::runtime_error("invalid raw file: header too short (" + std::to_string(data.size()) +
                             " bytes)");
  }

  application::ports::RawScanInfo info;
  info.scanType = scan_type_name(data[0]);
  info.quality = quality_name(data[1]);
  info.format = format_name(data[2], data[3]);
  info.width = static_cast<uint16_t>(data[12] | (data[13] << 8));
  info.fileSize = data.size();

  // Every row ends with the width as a little-endian marker. Matches are
  // counted without overlap over the image data; the header's own width field
  // is not a row.
  const uint8_t lo = static_cast<uint8_t>(info.width & 0xFF);
  const uint8_t hi = static_cast<uint8_t>(info.width >> 8);
  std::size_t count = 0;
  for (std::size_t i = kHeaderSize; i + 1 < data.size();)
  {
    if (data[i] == lo && data[i + 1] == hi)
    {
      ++count;
      i += 2;
    }
    else
    {
      ++i;
    }
  }
  info.height = count;
  info.rowSize = count > 0 ? (data.size() - kHeaderSize) / count : 0;
  return info;
}

}  // namespace scanbridge::infrastructure::decoder
