#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "application/services/Bootstrap.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <gtest/gtest.h>

namespace infra_cfg  = scanbridge::infrastructure::config;
namespace infra_log  = scanbridge::infrastructure::logging;
namespace app_srv    = scanbridge::application::services;
namespace fs = boost::filesystem;

static fs::path tmp_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / "scanbridge-bootstrap" / name;
  fs::create_directories(dir);
  return dir;
}

TEST(Bootstrap, EndToEndCreatesConfigAndLogs) {
  auto dir = tmp_dir("boot");
  auto cfg = dir / "boot.toml";
  {
    std::ofstream out(cfg.string());
    out << "[logging]\nshowConsole=false\nlogsDir=\"" << (dir / "logs").generic_string() << "\"\n";
  }

  infra_cfg::Config_Toml cfg_impl;
  infra_log::Logger_Spdlog log_impl;

  app_srv::Bootstrap app{cfg_impl, log_impl};
  scanbridge::domain::Settings s;
  EXPECT_NO_THROW(s = app.run(cfg.string(), "agent"));
  EXPECT_EQ(s.configPath, cfg.string());
  EXPECT_TRUE(fs::exists(dir / "logs" / "scanbridge_app.log"));
  EXPECT_TRUE(fs::exists(dir / "logs" / "scanbridge_socket.log"));
}

TEST(Bootstrap, CreatesMissingConfig) {
  auto dir = tmp_dir("fresh");
  auto cfg = dir / "fresh.toml";
  if (fs::exists(cfg)) fs::remove(cfg);

  infra_cfg::Config_Toml cfg_impl;
  infra_log::Logger_Spdlog log_impl;

  app_srv::Bootstrap app{cfg_impl, log_impl};
  EXPECT_NO_THROW(app.run(cfg.string(), "relay"));
  EXPECT_TRUE(fs::exists(cfg));
}
