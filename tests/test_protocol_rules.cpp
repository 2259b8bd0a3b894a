#include <gtest/gtest.h>

#include "domain/protocol/ProtocolRules.hpp"
#include "infrastructure/codec/FrameCodec_Scanner.hpp"

using namespace scanbridge::domain::protocol;
using scanbridge::infrastructure::codec::FrameCodec_Scanner;

TEST(ProtocolRules, DiscoveryProbeHasZeroReserved)
{
  const auto f = ProtocolRules::discovery_probe({10, 0, 0, 5}, "Scanner");
  EXPECT_EQ(f.type, MessageType::discovery);
  EXPECT_EQ(f.initiatorIp, (Ipv4Bytes{10, 0, 0, 5}));
  EXPECT_EQ(f.srcName, "Scanner");
  EXPECT_TRUE(f.dstName.empty());
  EXPECT_EQ(f.reserved1, (std::array<uint8_t, 6>{}));
  EXPECT_EQ(f.reserved2, (std::array<uint8_t, 4>{}));
  EXPECT_EQ(f.reserved3, (std::array<uint8_t, 10>{}));
}

TEST(ProtocolRules, TransferProbeCarriesBothNames)
{
  const auto f = ProtocolRules::transfer_probe({10, 0, 0, 5}, "Scanner", "Agent1");
  EXPECT_EQ(f.type, MessageType::file_transfer);
  EXPECT_EQ(f.srcName, "Scanner");
  EXPECT_EQ(f.dstName, "Agent1");
}

TEST(ProtocolRules, DiscoveryReplyEchoesRequesterName)
{
  const auto req = ProtocolRules::discovery_probe({10, 0, 0, 5}, "Scanner");
  const auto rep = ProtocolRules::reply_to(req, {10, 0, 0, 9}, "Agent1");

  EXPECT_EQ(rep.type, MessageType::discovery);
  EXPECT_EQ(rep.srcName, "Scanner");
  EXPECT_EQ(rep.dstName, "Agent1");
  EXPECT_EQ(rep.initiatorIp, (Ipv4Bytes{10, 0, 0, 9}));
  EXPECT_EQ(rep.reserved1, kVendorReserved1);
  EXPECT_EQ(rep.reserved2, kVendorReserved2);
}

TEST(ProtocolRules, TransferProbeGetsTransferAck)
{
  const auto req = ProtocolRules::transfer_probe({10, 0, 0, 5}, "Scanner", "Agent1");
  EXPECT_TRUE(std::holds_alternative<TransferAck>(ProtocolRules::select_reply(req.type)));

  const auto rep = ProtocolRules::reply_to(req, {10, 0, 0, 9}, "Agent1");
  EXPECT_EQ(rep.type, MessageType::file_transfer);
  EXPECT_EQ(rep.srcName, "Scanner");
  EXPECT_EQ(rep.dstName, "Agent1");
}

TEST(ProtocolRules, VendorConstantsOnTheWire)
{
  FrameCodec_Scanner codec;
  const auto req = ProtocolRules::discovery_probe({10, 0, 0, 5}, "Scanner");
  const auto b = codec.encode(ProtocolRules::reply_to(req, {10, 0, 0, 9}, "Agent1"));

  const uint8_t r1[] = {0x00, 0x09, 0xB9, 0x00, 0x2C, 0x84};
  const uint8_t r2[] = {0x00, 0x00, 0x02, 0xC4};
  for (int i = 0; i < 6; ++i) EXPECT_EQ(std::to_integer<uint8_t>(b[6 + i]), r1[i]) << i;
  for (int i = 0; i < 4; ++i) EXPECT_EQ(std::to_integer<uint8_t>(b[16 + i]), r2[i]) << i;
}

TEST(ProtocolRules, ReplyDropsNonAsciiFromEchoedName)
{
  FrameCodec_Scanner codec;
  auto raw = codec.encode(ProtocolRules::discovery_probe({10, 0, 0, 5}, "Scanner"));
  raw[20] = std::byte{0xC3};

  const auto req = codec.decode(raw);
  const auto rep = ProtocolRules::reply_to(req, {10, 0, 0, 9}, "Agent1");
  EXPECT_EQ(rep.srcName, "canner");
  EXPECT_NO_THROW(codec.encode(rep));
}

TEST(ProtocolRules, ReplyCutsEchoedNameAtZero)
{
  FrameCodec_Scanner codec;
  auto raw = codec.encode(ProtocolRules::discovery_probe({10, 0, 0, 5}, "Scanner"));
  raw[22] = std::byte{0x00};  // "Sc\0nner"

  const auto req = codec.decode(raw);
  EXPECT_EQ(req.srcName.size(), 7u);
  const auto rep = ProtocolRules::reply_to(req, {10, 0, 0, 9}, "Agent1");
  EXPECT_EQ(rep.srcName, "Sc");
  EXPECT_NO_THROW(codec.encode(rep));
}
