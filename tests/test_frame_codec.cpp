#include <gtest/gtest.h>

#include <vector>

#include "domain/Errors.hpp"
#include "domain/protocol/ProtocolRules.hpp"
#include "infrastructure/codec/FrameCodec_Scanner.hpp"

using namespace scanbridge::domain::protocol;
using scanbridge::domain::EncodingError;
using scanbridge::domain::FormatError;
using scanbridge::infrastructure::codec::FrameCodec_Scanner;

static uint8_t at(const FrameBytes& b, std::size_t i) { return std::to_integer<uint8_t>(b[i]); }

static ProtocolFrame sample()
{
  ProtocolFrame f;
  f.type = MessageType::file_transfer;
  f.reserved1 = {1, 2, 3, 4, 5, 6};
  f.initiatorIp = {10, 0, 0, 5};
  f.reserved2 = {7, 8, 9, 10};
  f.srcName = "Scanner";
  f.dstName = "Agent1";
  f.reserved3 = {0xA0, 0xA1, 0xA2, 0xA3, 0xA4, 0xA5, 0xA6, 0xA7, 0xA8, 0xA9};
  return f;
}

TEST(FrameCodec, EncodesFieldsInWireOrder)
{
  FrameCodec_Scanner codec;
  const auto b = codec.encode(sample());

  ASSERT_EQ(b.size(), 90u);
  EXPECT_EQ(at(b, 0), 0x55);
  EXPECT_EQ(at(b, 1), 0x00);
  EXPECT_EQ(at(b, 2), 0x00);
  EXPECT_EQ(at(b, 3), 0x5A);
  EXPECT_EQ(at(b, 4), 0x54);
  EXPECT_EQ(at(b, 5), 0x00);
  EXPECT_EQ(at(b, 6), 1);
  EXPECT_EQ(at(b, 11), 6);
  EXPECT_EQ(at(b, 12), 10);
  EXPECT_EQ(at(b, 15), 5);
  EXPECT_EQ(at(b, 16), 7);
  EXPECT_EQ(at(b, 19), 10);
  EXPECT_EQ(at(b, 20), 'S');
  EXPECT_EQ(at(b, 26), 'r');
  EXPECT_EQ(at(b, 27), 0);  // padding
  EXPECT_EQ(at(b, 39), 0);
  EXPECT_EQ(at(b, 40), 'A');
  EXPECT_EQ(at(b, 45), '1');
  EXPECT_EQ(at(b, 46), 0);
  EXPECT_EQ(at(b, 79), 0);
  EXPECT_EQ(at(b, 80), 0xA0);
  EXPECT_EQ(at(b, 89), 0xA9);
}

TEST(FrameCodec, RoundTripKeepsReservedBitForBit)
{
  FrameCodec_Scanner codec;
  const auto f = sample();
  const auto bytes = codec.encode(f);
  const auto back = codec.decode(bytes);

  EXPECT_EQ(back, f);
  EXPECT_EQ(codec.encode(back), bytes);
}

TEST(FrameCodec, RejectsWrongLength)
{
  FrameCodec_Scanner codec;
  const auto good = codec.encode(sample());

  std::vector<std::byte> shorter(good.begin(), good.end() - 1);
  std::vector<std::byte> longer(good.begin(), good.end());
  longer.push_back(std::byte{0});

  EXPECT_THROW(codec.decode(shorter), FormatError);
  EXPECT_THROW(codec.decode(longer), FormatError);
  EXPECT_THROW(codec.decode({}), FormatError);
}

TEST(FrameCodec, RejectsBadSignature)
{
  FrameCodec_Scanner codec;
  auto b = codec.encode(sample());
  b[0] = std::byte{0x54};
  EXPECT_THROW(codec.decode(b), FormatError);
}

TEST(FrameCodec, RejectsUnknownMessageType)
{
  FrameCodec_Scanner codec;
  auto b = codec.encode(sample());
  b[4] = std::byte{0x01};  // 5A 01 00
  EXPECT_THROW(codec.decode(b), FormatError);
}

TEST(FrameCodec, DecodesDiscoveryType)
{
  FrameCodec_Scanner codec;
  auto f = sample();
  f.type = MessageType::discovery;
  const auto b = codec.encode(f);
  EXPECT_EQ(at(b, 4), 0x00);
  EXPECT_EQ(codec.decode(b).type, MessageType::discovery);
}

TEST(FrameCodec, StripsOnlyTrailingZeros)
{
  FrameCodec_Scanner codec;
  auto b = codec.encode(sample());
  // "Sc\0nner" keeps its interior zero
  b[22] = std::byte{0};
  EXPECT_EQ(codec.decode(b).srcName, std::string("Sc\0nner", 7));
}

TEST(FrameCodec, NameWidthPolicy)
{
  FrameCodec_Scanner codec;
  auto f = sample();

  f.srcName = std::string(20, 'x');
  f.dstName = std::string(40, 'y');
  EXPECT_NO_THROW(codec.encode(f));

  f.srcName = std::string(21, 'x');
  EXPECT_THROW(codec.encode(f), EncodingError);

  f.srcName = "ok";
  f.dstName = std::string(41, 'y');
  EXPECT_THROW(codec.encode(f), EncodingError);

  f.dstName = std::string("a\0b", 3);
  EXPECT_THROW(codec.encode(f), EncodingError);

  f.dstName = "caf\xC3\xA9";
  EXPECT_THROW(codec.encode(f), EncodingError);
}
