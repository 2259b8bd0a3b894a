#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <span>
#include <sstream>
#include <string>

namespace scanbridge::shared::hex
{

// -----------------------------------------------------------------------------
// hex_dump(data, max_len)
//  - "55 00 00 5A ..." with a byte-count suffix when truncated
// -----------------------------------------------------------------------------
inline std::string hex_dump(std::span<const std::byte> data, size_t max_len = 64)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');

  const size_t take = (max_len > 0) ? (std::min)(max_len, data.size()) : data.size();

  for (size_t i = 0; i < take; ++i)
  {
    const auto v = static_cast<unsigned int>(std::to_integer<unsigned char>(data[i]));
    oss << std::setw(2) << v << ' ';
  }

  if (take < data.size())
  {
    oss << "...(" << data.size() << " bytes total)";
  }

  return oss.str();
}

// compact form for fixed fields: "0009B9002C84"
template <size_t N>
inline std::string to_hex(const std::array<uint8_t, N>& field)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');
  for (auto b : field) oss << std::setw(2) << static_cast<unsigned int>(b);
  return oss.str();
}

// -----------------------------------------------------------------------------
// make_line(tag, span, max)
// -----------------------------------------------------------------------------
inline std::string make_line(const char* tag, std::span<const std::byte> sp, size_t max = 32)
{
  std::string line;
  line.reserve(64 + max * 3);
  line.append(tag).append(" n=").append(std::to_string(sp.size())).append(": ");
  line += hex_dump(sp, max);
  return line;
}

}  // namespace scanbridge::shared::hex
