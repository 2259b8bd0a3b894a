#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "domain/protocol/FrameLayout.hpp"
#include "domain/protocol/ProtocolFrame.hpp"

namespace scanbridge::domain::protocol
{

// ---- Reply policies ----
// A responder never patches a request in place; it selects one of these by
// the request's message type and builds a fresh frame from it.
struct DiscoveryReply
{
};
struct TransferAck
{
};
using ReplyPolicy = std::variant<DiscoveryReply, TransferAck>;

struct ProtocolRules
{
  // Client frames: reserved fields all zero.
  static ProtocolFrame discovery_probe(const Ipv4Bytes& local_ip, std::string_view src_name)
  {
    ProtocolFrame f;
    f.type = MessageType::discovery;
    f.initiatorIp = local_ip;
    f.srcName = std::string(src_name);
    return f;
  }

  static ProtocolFrame transfer_probe(const Ipv4Bytes& local_ip, std::string_view src_name,
                                      std::string_view dst_name)
  {
    ProtocolFrame f;
    f.type = MessageType::file_transfer;
    f.initiatorIp = local_ip;
    f.srcName = std::string(src_name);
    f.dstName = std::string(dst_name);
    return f;
  }

  // Requester name as it goes back on the wire: cut at the first zero byte,
  // non-ASCII bytes dropped. Decoding keeps whatever the requester sent.
  static std::string echo_name(std::string_view name)
  {
    std::string out;
    out.reserve(name.size());
    for (char ch : name)
    {
      const auto u = static_cast<unsigned char>(ch);
      if (u == 0) break;
      if (u <= 0x7F) out.push_back(ch);
    }
    return out;
  }

  static ReplyPolicy select_reply(MessageType t) noexcept
  {
    if (t == MessageType::file_transfer) return TransferAck{};
    return DiscoveryReply{};
  }

  // The reply echoes the requester's name in srcName and puts our own name in
  // dstName. The appliance expects exactly this asymmetry.
  static ProtocolFrame build_reply(const ReplyPolicy& policy, const ProtocolFrame& request,
                                   const Ipv4Bytes& self_ip, std::string_view self_name)
  {
    ProtocolFrame f;
    f.type = std::visit(
        [](const auto& p) -> MessageType
        {
          using P = std::decay_t<decltype(p)>;
          if constexpr (std::is_same_v<P, TransferAck>)
            return MessageType::file_transfer;
          else
            return MessageType::discovery;
        },
        policy);
    f.reserved1 = kVendorReserved1;
    f.initiatorIp = self_ip;
    f.reserved2 = kVendorReserved2;
    f.srcName = echo_name(request.srcName);
    f.dstName = std::string(self_name);
    return f;
  }

  static ProtocolFrame reply_to(const ProtocolFrame& request, const Ipv4Bytes& self_ip,
                                std::string_view self_name)
  {
    return build_reply(select_reply(request.type), request, self_ip, self_name);
  }
};

}  // namespace scanbridge::domain::protocol
