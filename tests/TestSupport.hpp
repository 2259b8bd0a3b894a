#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <mutex>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::testing
{

// ----------------------------- Test Logger -----------------------------
struct TestLogger : scanbridge::application::ports::ILogger
{
  void init(const scanbridge::domain::Settings&) override {}
  void app(scanbridge::application::ports::LogLevel, const std::string& m) override { keep(m); }
  void sock(scanbridge::application::ports::LogLevel, std::string_view m) override
  {
    keep(std::string(m));
  }

  bool saw(const std::string& needle)
  {
    std::lock_guard<std::mutex> lk(mtx);
    for (const auto& l : lines)
      if (l.find(needle) != std::string::npos) return true;
    return false;
  }

  void keep(std::string m)
  {
    std::lock_guard<std::mutex> lk(mtx);
    lines.push_back(std::move(m));
  }

  std::mutex mtx;
  std::vector<std::string> lines;
};

// ----------------------------- Helpers -----------------------------
inline boost::filesystem::path fresh_dir(const std::string& name)
{
  namespace fs = boost::filesystem;
  auto dir = fs::temp_directory_path() / ("scanbridge-" + name + "-" + fs::unique_path().string());
  fs::create_directories(dir);
  return dir;
}

// Everything on loopback with ephemeral ports.
inline scanbridge::domain::Settings loopback_settings(const boost::filesystem::path& storage = {})
{
  scanbridge::domain::Settings s;
  s.network.udpPort = 0;
  s.network.tcpPort = 0;
  s.network.ioThreads = 1;
  s.agent.name = "Agent1";
  s.agent.bindAddress = "127.0.0.1";
  s.agent.advertiseIp = "10.0.0.9";
  s.agent.storageDir = storage.string();
  s.relay.bindAddress = "127.0.0.1";
  s.relay.receiverHost = "127.0.0.1";
  s.relay.listenUdpPort = 0;
  s.relay.listenTcpPort = 0;
  s.relay.applianceSubnet = "127.0.0.0/8";
  s.showConsole = false;
  s.saveLog = false;
  s.saveSocketLog = false;
  return s;
}

// A port nobody listens on: bind an ephemeral one and release it.
template <class Protocol>
inline uint16_t unused_port()
{
  boost::asio::io_context io;
  typename Protocol::socket s(io);
  s.open(Protocol::v4());
  s.bind({boost::asio::ip::make_address_v4("127.0.0.1"), 0});
  return s.local_endpoint().port();
}

inline std::vector<std::byte> pattern_bytes(std::size_t n)
{
  std::vector<std::byte> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = std::byte(static_cast<unsigned char>((i * 31 + 7) & 0xFF));
  return v;
}

}  // namespace scanbridge::testing
