#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace scanbridge::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

// Two channels: "app" for lifecycle and summaries, "sock" for per-datagram and
// per-connection traffic.
struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const scanbridge::domain::Settings& s) = 0;
  virtual void app(LogLevel level, const std::string& msg) = 0;
  virtual void sock(LogLevel level, std::string_view msg) = 0;
};

}  // namespace scanbridge::application::ports
