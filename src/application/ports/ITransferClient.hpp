#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "domain/protocol/ProtocolFrame.hpp"

namespace scanbridge::application::ports
{

enum class TransferState
{
  open,
  pending,
  complete,
  failed
};

using ProgressCallback = std::function<void(std::uint64_t sent, std::uint64_t total)>;

struct TransferRequest
{
  std::string localIp;
  uint16_t localPort{706};
  std::string targetIp;
  uint16_t udpPort{706};
  uint16_t tcpPort{708};
  std::string sourceName;
  std::string destName;
  std::string filePath;
  std::chrono::milliseconds udpTimeout{5000};
  std::chrono::milliseconds tcpTimeout{10000};
  std::chrono::milliseconds pollInterval{1000};
  std::size_t chunkSize{8192};
  ProgressCallback progress;
};

struct TransferResult
{
  bool ok{false};
  TransferState state{TransferState::open};
  std::optional<domain::protocol::ProtocolFrame> ack;  // nullopt = no UDP reply in time
  std::uint64_t bytesSent{0};
  std::uint64_t totalBytes{0};
  std::string error;
};

struct ITransferClient
{
  virtual ~ITransferClient() = default;
  virtual TransferResult send(const TransferRequest& req) = 0;
};

}  // namespace scanbridge::application::ports
