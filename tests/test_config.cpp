#include "infrastructure/config/Config_Toml.hpp"
#include "domain/Settings.hpp"
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fstream>

using scanbridge::infrastructure::config::Config_Toml;
using scanbridge::domain::Settings;
namespace fs = boost::filesystem;

static fs::path tmp_file(const std::string& name) {
  auto dir = fs::temp_directory_path() / "scanbridge-tests";
  fs::create_directories(dir);
  return dir / name;
}

TEST(ConfigToml, CreatesWithDefaultsWhenMissing) {
  auto cfg = tmp_file("missing.toml");
  if (fs::exists(cfg)) fs::remove(cfg);

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_TRUE(fs::exists(cfg));
  EXPECT_EQ(s.network.udpPort, 706);
  EXPECT_EQ(s.network.tcpPort, 708);
  EXPECT_EQ(s.network.discoveryTimeoutMs, 10000);
  EXPECT_EQ(s.network.tcpChunkSize, 8192u);
  EXPECT_EQ(s.agent.retention, 10u);
  EXPECT_EQ(s.relay.applianceSubnet, "10.0.52.0/24");
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.socketLogFilename.empty());
  EXPECT_FALSE(s.logsDir.empty());

  // the written file reads back to the same values
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_EQ(again.agent.name, s.agent.name);
  EXPECT_EQ(again.relay.receiverHost, s.relay.receiverHost);
}

TEST(ConfigToml, ReadsCustomValues) {
  auto cfg = tmp_file("custom.toml");
  {
    std::ofstream out(cfg.string());
    out << "[network]\nudpPort=7060\nioThreads=4\nreadIdleTimeoutMs=30000\n"
           "[agent]\nname=\"Agent1\"\nretention=3\nmode=\"forward\"\nforwardHost=\"10.1.1.1\"\n"
           "[relay]\nreceiverHost=\"192.168.1.2\"\nsynthesizeReply=false\n"
           "\n[logging]\nshowConsole=true\nsaveLog=false\nsaveSocketLog=false\n"
           "level=\"debug\"\nlogsDir=\"logs-x\"\nappLogFilename=\"a.log\"\nsocketLogFilename=\"s.log\"\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.network.udpPort, 7060);
  EXPECT_EQ(s.network.tcpPort, 708);
  EXPECT_EQ(s.network.ioThreads, 4);
  EXPECT_EQ(s.network.readIdleTimeoutMs, 30000);
  EXPECT_EQ(s.agent.name, "Agent1");
  EXPECT_EQ(s.agent.retention, 3u);
  EXPECT_EQ(s.agent.mode, "forward");
  EXPECT_EQ(s.agent.forwardHost, "10.1.1.1");
  EXPECT_EQ(s.relay.receiverHost, "192.168.1.2");
  EXPECT_FALSE(s.relay.synthesizeReply);
  EXPECT_TRUE(s.showConsole);
  EXPECT_FALSE(s.saveLog);
  EXPECT_FALSE(s.saveSocketLog);
  EXPECT_EQ(s.logLevel, "debug");
  EXPECT_EQ(s.logsDir, "logs-x");
  EXPECT_EQ(s.appLogFilename, "a.log");
  EXPECT_EQ(s.socketLogFilename, "s.log");
}

TEST(ConfigToml, ClampsNonsense) {
  auto cfg = tmp_file("clamp.toml");
  {
    std::ofstream out(cfg.string());
    out << "[network]\nioThreads=0\ntcpChunkSize=0\nudpPort=70000\n"
           "[agent]\nbindAddress=\"\"\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.network.ioThreads, 1);
  EXPECT_EQ(s.network.tcpChunkSize, 8192u);
  EXPECT_EQ(s.network.udpPort, 706);  // out of range, default kept
  EXPECT_EQ(s.agent.bindAddress, "0.0.0.0");
}

TEST(ConfigToml, OutOfRangeIntegersKeepDefaults) {
  auto cfg = tmp_file("huge.toml");
  {
    std::ofstream out(cfg.string());
    out << "[network]\ndiscoveryTimeoutMs=5000000000\nudpTimeoutMs=-5000000000\n"
           "tcpConnectTimeoutMs=2000\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.network.discoveryTimeoutMs, 10000);
  EXPECT_EQ(s.network.udpTimeoutMs, 5000);
  EXPECT_EQ(s.network.tcpConnectTimeoutMs, 2000);
}

TEST(ConfigToml, FallbackWhenSectionMissing) {
  auto cfg = tmp_file("no-logging.toml");
  {
    std::ofstream out(cfg.string());
    out << "[network]\nudpPort=706\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.socketLogFilename.empty());
  EXPECT_EQ(s.agent.storageDir, "files");
}

TEST(ConfigToml, UnparsableFileIsReplacedByDefaults) {
  auto cfg = tmp_file("broken.toml");
  {
    std::ofstream out(cfg.string());
    out << "[network\nudpPort = = 1\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());
  EXPECT_EQ(s.network.udpPort, 706);

  // rewritten, so it parses now
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_EQ(again.network.udpPort, 706);
  EXPECT_EQ(again.agent.name, "Agent");
}
