#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::infrastructure::logging
{

class Logger_Spdlog final : public scanbridge::application::ports::ILogger
{
 public:
  void init(const scanbridge::domain::Settings& s) override;

  void app(scanbridge::application::ports::LogLevel level, const std::string& msg) override;

  void sock(scanbridge::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(scanbridge::application::ports::LogLevel level);

  // "trace".."critical", "off"; anything else maps to info
  static scanbridge::application::ports::LogLevel parse_level(std::string_view name);

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> sock_;

  // Helpers
  static spdlog::level::level_enum map_level(scanbridge::application::ports::LogLevel l);
};

}  // namespace scanbridge::infrastructure::logging
