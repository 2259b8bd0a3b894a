#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <boost/filesystem.hpp>
#include <chrono>
#include <vector>

namespace fs = boost::filesystem;
using scanbridge::application::ports::LogLevel;

namespace scanbridge::infrastructure::logging {

namespace {
constexpr std::size_t kRotateBytes = 5 * 1024 * 1024;
constexpr std::size_t kRotateFiles = 3;
}

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts ports::LogLevel to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

LogLevel Logger_Spdlog::parse_level(std::string_view name) {
  if (name == "trace")    return LogLevel::trace;
  if (name == "debug")    return LogLevel::debug;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "err" || name == "error")    return LogLevel::err;
  if (name == "critical") return LogLevel::critical;
  if (name == "off")      return LogLevel::off;
  return LogLevel::info;
}

// -------------------------------------------------------------------------------------------------
// configure_console_colors_
//  - Per-level colors on the console sink only (ANSI escapes).
// -------------------------------------------------------------------------------------------------
static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stdout_sink_mt>& sink) {
  const std::string BGRAY   = "\x1b[90m";
  const std::string CYAN    = "\x1b[36m";
  const std::string GREEN   = "\x1b[32m";
  const std::string YELLOW  = "\x1b[33m";
  const std::string RED     = "\x1b[31m";
  const std::string MAGENTA = "\x1b[35m";

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - Rotating file sink per channel ("app", "socket") when saveLog / saveSocketLog are set.
//  - Colored console sink shared by both channels when showConsole is set.
//  - Async loggers on the shared spdlog pool so socket handlers never block on I/O.
//  - Safe to call again: previously registered channels are dropped first.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const scanbridge::domain::Settings& s) {
  const fs::path dir      = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  const fs::path appPath  = dir / (s.appLogFilename.empty()    ? "scanbridge_app.log"    : s.appLogFilename);
  const fs::path sockPath = dir / (s.socketLogFilename.empty() ? "scanbridge_socket.log" : s.socketLogFilename);

  if (auto prev = spdlog::get("app"))    spdlog::drop(prev->name());
  if (auto prev = spdlog::get("socket")) spdlog::drop(prev->name());
  app_.reset();
  sock_.reset();

  std::vector<spdlog::sink_ptr> app_sinks;
  std::vector<spdlog::sink_ptr> sock_sinks;

  if (s.saveLog || s.saveSocketLog) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
  }

  if (s.saveLog) {
    auto app_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), kRotateBytes, kRotateFiles);
    app_file->set_level(spdlog::level::trace);
    app_sinks.push_back(app_file);
  }
  if (s.saveSocketLog) {
    auto sock_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(sockPath.string(), kRotateBytes, kRotateFiles);
    sock_file->set_level(spdlog::level::trace);
    sock_sinks.push_back(sock_file);
  }

  if (s.showConsole) {
    auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
    configure_console_colors_(console_sink);
    console_sink->set_level(spdlog::level::debug);
    app_sinks.push_back(console_sink);
    sock_sinks.push_back(console_sink);
  }

  const size_t qsize   = 8192;
  const size_t workers = 1;
  if (!spdlog::thread_pool()) spdlog::init_thread_pool(qsize, workers);

  app_  = std::make_shared<spdlog::async_logger>("app",    app_sinks.begin(),  app_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  sock_ = std::make_shared<spdlog::async_logger>("socket", sock_sinks.begin(), sock_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::register_logger(app_);
  spdlog::register_logger(sock_);

  // ONLY console renders colors between %^ and %$.
  const char* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
  app_->set_pattern(pattern);
  sock_->set_pattern(pattern);

  set_level(parse_level(s.logLevel));

  app_->flush_on(spdlog::level::err);
  sock_->flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(2));
}

void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

void Logger_Spdlog::sock(LogLevel level, std::string_view msg) {
  if (sock_) sock_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts both channels at runtime; per-sink levels still apply.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  auto lv = map_level(level);
  if (app_)  app_->set_level(lv);
  if (sock_) sock_->set_level(lv);
}

} // namespace scanbridge::infrastructure::logging
