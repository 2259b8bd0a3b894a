#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "TestSupport.hpp"
#include "infrastructure/decoder/RawDecoder_Header.hpp"

using scanbridge::infrastructure::decoder::RawDecoder_Header;
namespace fs = boost::filesystem;

// header + `rows` rows of [width pixels][width LE][00 00]
static std::vector<uint8_t> make_raw(char type, char quality, const char fmt[2], uint16_t width,
                                     int rows)
{
  std::vector<uint8_t> v(16, 0);
  v[0] = static_cast<uint8_t>(type);
  v[1] = static_cast<uint8_t>(quality);
  v[2] = static_cast<uint8_t>(fmt[0]);
  v[3] = static_cast<uint8_t>(fmt[1]);
  v[12] = static_cast<uint8_t>(width & 0xFF);
  v[13] = static_cast<uint8_t>(width >> 8);

  for (int r = 0; r < rows; ++r)
  {
    v.insert(v.end(), width, 0x80);
    v.push_back(static_cast<uint8_t>(width & 0xFF));
    v.push_back(static_cast<uint8_t>(width >> 8));
    v.push_back(0);
    v.push_back(0);
  }
  return v;
}

static std::string save(const std::vector<uint8_t>& v, const std::string& name)
{
  const auto p = scanbridge::testing::fresh_dir("raw") / name;
  std::ofstream out(p.string(), std::ios::binary);
  out.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(v.size()));
  return p.string();
}

TEST(RawDecoder, ReadsHeaderAndCountsRows)
{
  RawDecoder_Header dec;
  const auto info = dec.inspect(save(make_raw('G', '3', "JP", 100, 5), "gray.raw"));

  EXPECT_EQ(info.scanType, "grayscale");
  EXPECT_EQ(info.quality, "medium");
  EXPECT_EQ(info.format, "jpg");
  EXPECT_EQ(info.width, 100);
  EXPECT_EQ(info.height, 5u);
  EXPECT_EQ(info.fileSize, 16u + 5u * 104u);
  EXPECT_EQ(info.rowSize, 104u);
}

TEST(RawDecoder, KnownCodes)
{
  EXPECT_EQ(RawDecoder_Header::scan_type_name('B'), "black_white");
  EXPECT_EQ(RawDecoder_Header::scan_type_name('R'), "color");
  EXPECT_EQ(RawDecoder_Header::quality_name('2'), "standard");
  EXPECT_EQ(RawDecoder_Header::quality_name('6'), "high");
  EXPECT_EQ(RawDecoder_Header::format_name('P', 'D'), "pdf");
}

TEST(RawDecoder, UnknownCodesAreNamedByValue)
{
  RawDecoder_Header dec;
  const auto info = dec.inspect(save(make_raw('X', 0x01, "ZZ", 8, 2), "odd.raw"));
  EXPECT_EQ(info.scanType, "unknown_0x58");
  EXPECT_EQ(info.quality, "unknown_0x01");
  EXPECT_EQ(info.format, "unknown_0x5A5A");
}

TEST(RawDecoder, NoMarkersMeansZeroHeight)
{
  RawDecoder_Header dec;
  auto v = make_raw('B', '2', "JP", 0x1234, 0);
  v.insert(v.end(), 50, 0x80);
  const auto info = dec.inspect(save(v, "flat.raw"));
  EXPECT_EQ(info.height, 0u);
  EXPECT_EQ(info.rowSize, 0u);
}

TEST(RawDecoder, RejectsShortAndMissingFiles)
{
  RawDecoder_Header dec;
  EXPECT_THROW(dec.inspect(save(std::vector<uint8_t>(15, 0x42), "short.raw")), std::runtime_error);
  EXPECT_THROW(dec.inspect("/nonexistent/scan.raw"), std::runtime_error);
}
