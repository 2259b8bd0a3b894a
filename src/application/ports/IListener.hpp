#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "domain/protocol/ProtocolFrame.hpp"

namespace scanbridge::application::ports
{

// Long-lived socket owner. start() binds and begins serving; stop() closes
// every socket it owns and joins its threads.
struct IListener
{
  virtual ~IListener() = default;

  virtual bool start() = 0;
  virtual void stop() = 0;
  virtual bool running() const = 0;
  virtual uint16_t local_port() const = 0;
};

// UDP 706 responder. Services wire the observability callback.
struct IFrameResponder : IListener
{
  std::function<void(const domain::protocol::ProtocolFrame&, const std::string& sender)> on_frame;
};

struct ReceivedScan
{
  std::string path;
  std::string peer;  // "ip:port"
  std::uint64_t bytes{0};
  bool complete{false};  // false: stream broke before EOF, partial file kept
  std::string error;
};

// TCP 708 bulk receiver.
struct IScanReceiver : IListener
{
  std::function<void(const ReceivedScan&)> on_complete;
};

}  // namespace scanbridge::application::ports
