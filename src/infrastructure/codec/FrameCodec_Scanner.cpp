#include "infrastructure/codec/FrameCodec_Scanner.hpp"

#include <algorithm>
#include <string>

#include "domain/Errors.hpp"

namespace scanbridge::infrastructure::codec
{
namespace proto = scanbridge::domain::protocol;
namespace layout = scanbridge::domain::protocol::layout;
using scanbridge::domain::EncodingError;
using scanbridge::domain::FormatError;

namespace
{

template <std::size_t N>
void put_bytes(proto::FrameBytes& out, std::size_t off, const std::array<uint8_t, N>& src)
{
  for (std::size_t i = 0; i < N; ++i) out[off + i] = std::byte{src[i]};
}

template <std::size_t N>
std::array<uint8_t, N> get_bytes(std::span<const std::byte> in, std::size_t off)
{
  std::array<uint8_t, N> a{};
  for (std::size_t i = 0; i < N; ++i) a[i] = std::to_integer<uint8_t>(in[off + i]);
  return a;
}

void put_code(proto::FrameBytes& out, std::size_t off, proto::Code3 c)
{
  out[off] = std::byte{c.a};
  out[off + 1] = std::byte{c.b};
  out[off + 2] = std::byte{c.c};
}

void put_name(proto::FrameBytes& out, std::size_t off, std::size_t width, const std::string& v)
{
  for (std::size_t i = 0; i < width; ++i)
  {
    out[off + i] = i < v.size() ? std::byte{static_cast<unsigned char>(v[i])} : std::byte{0};
  }
}

// Strip the trailing zero padding only; anything before it is kept as sent.
std::string get_name(std::span<const std::byte> in, std::size_t off, std::size_t width)
{
  std::size_t len = width;
  while (len > 0 && in[off + len - 1] == std::byte{0}) --len;

  std::string s;
  s.reserve(len);
  for (std::size_t i = 0; i < len; ++i)
    s.push_back(static_cast<char>(std::to_integer<unsigned char>(in[off + i])));
  return s;
}

}  // namespace

void FrameCodec_Scanner::check_name(std::string_view value, std::size_t width, const char* field)
{
  if (value.size() > width)
  {
    throw EncodingError(std::string(field) + " exceeds " + std::to_string(width) + " bytes (got " +
                        std::to_string(value.size()) + ")");
  }
  for (char ch : value)
  {
    const auto u = static_cast<unsigned char>(ch);
    if (u == 0) throw EncodingError(std::string(field) + " contains a zero byte");
    if (u > 0x7F) throw EncodingError(std::string(field) + " is not ASCII");
  }
}

proto::FrameBytes FrameCodec_Scanner::encode(const proto::ProtocolFrame& frame) const
{
  check_name(frame.srcName, layout::kSrcNameSize, "srcName");
  check_name(frame.dstName, layout::kDstNameSize, "dstName");

  proto::FrameBytes out{};
  put_code(out, layout::kSignatureOff, proto::kSignature);
  put_code(out, layout::kTypeOff, proto::code_of(frame.type));
  put_bytes(out, layout::kReserved1Off, frame.reserved1);
  put_bytes(out, layout::kInitiatorIpOff, frame.initiatorIp);
  put_bytes(out, layout::kReserved2Off, frame.reserved2);
  put_name(out, layout::kSrcNameOff, layout::kSrcNameSize, frame.srcName);
  put_name(out, layout::kDstNameOff, layout::kDstNameSize, frame.dstName);
  put_bytes(out, layout::kReserved3Off, frame.reserved3);
  return out;
}

proto::ProtocolFrame FrameCodec_Scanner::decode(std::span<const std::byte> bytes) const
{
  if (bytes.size() != layout::kFrameSize)
  {
    throw FormatError("expected " + std::to_string(layout::kFrameSize) + " bytes, got " +
                      std::to_string(bytes.size()));
  }
  if (!proto::kSignature.matches(bytes.subspan(layout::kSignatureOff, layout::kSignatureSize)))
  {
    throw FormatError("unrecognized signature");
  }

  proto::ProtocolFrame f;
  const auto type = bytes.subspan(layout::kTypeOff, layout::kTypeSize);
  if (proto::kDiscoveryCode.matches(type))
    f.type = proto::MessageType::discovery;
  else if (proto::kFileTransferCode.matches(type))
    f.type = proto::MessageType::file_transfer;
  else
    throw FormatError("unknown message type");

  f.reserved1 = get_bytes<layout::kReserved1Size>(bytes, layout::kReserved1Off);
  f.initiatorIp = get_bytes<layout::kIpSize>(bytes, layout::kInitiatorIpOff);
  f.reserved2 = get_bytes<layout::kReserved2Size>(bytes, layout::kReserved2Off);
  f.srcName = get_name(bytes, layout::kSrcNameOff, layout::kSrcNameSize);
  f.dstName = get_name(bytes, layout::kDstNameOff, layout::kDstNameSize);
  f.reserved3 = get_bytes<layout::kReserved3Size>(bytes, layout::kReserved3Off);
  return f;
}

}  // namespace scanbridge::infrastructure::codec
