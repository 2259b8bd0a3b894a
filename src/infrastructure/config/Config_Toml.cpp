#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <toml++/toml.hpp>

using scanbridge::domain::Settings;
namespace fs = boost::filesystem;

namespace scanbridge::infrastructure::config
{

namespace
{
constexpr const char* kDefaultLogsDir = "logs";
constexpr const char* kDefaultAppLog = "scanbridge_app.log";
constexpr const char* kDefaultSocketLog = "scanbridge_socket.log";

const char* b2s(bool b)
{
  return b ? "true" : "false";
}

// Small readers so each section below stays one line per key.
void read(const toml::table& t, const char* key, std::string& out)
{
  if (auto v = t[key].value<std::string>()) out = *v;
}

void read(const toml::table& t, const char* key, bool& out)
{
  if (auto v = t[key].value<bool>()) out = *v;
}

void read(const toml::table& t, const char* key, int& out)
{
  if (auto v = t[key].value<int64_t>();
      v && *v >= std::numeric_limits<int>::min() && *v <= std::numeric_limits<int>::max())
    out = static_cast<int>(*v);
}

void read(const toml::table& t, const char* key, std::size_t& out)
{
  if (auto v = t[key].value<int64_t>(); v && *v >= 0) out = static_cast<std::size_t>(*v);
}

void read(const toml::table& t, const char* key, uint16_t& out)
{
  if (auto v = t[key].value<int64_t>(); v && *v >= 0 && *v <= std::numeric_limits<uint16_t>::max())
    out = static_cast<uint16_t>(*v);
}
}  // namespace

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  out << "# scanbridge.toml - auto-generated initial configuration\n"
         "# Edit as needed and restart the application\n\n";

  out << "[network]\n";
  out << "udpPort             = " << s.network.udpPort << "\n";
  out << "tcpPort             = " << s.network.tcpPort << "\n";
  out << "discoveryTimeoutMs  = " << s.network.discoveryTimeoutMs << "\n";
  out << "udpTimeoutMs        = " << s.network.udpTimeoutMs << "\n";
  out << "tcpConnectTimeoutMs = " << s.network.tcpConnectTimeoutMs << "\n";
  out << "socketTimeoutMs     = " << s.network.socketTimeoutMs << "\n";
  out << "udpBuffer           = " << s.network.udpBuffer << "\n";
  out << "tcpChunkSize        = " << s.network.tcpChunkSize << "\n";
  out << "tcpRecvBuffer       = " << s.network.tcpRecvBuffer << "\n";
  out << "readIdleTimeoutMs   = " << s.network.readIdleTimeoutMs << "   # 0 = wait for peer close\n";
  out << "ioThreads           = " << s.network.ioThreads << "\n\n";

  out << "[scanner]\n";
  out << "name        = \"" << s.scanner.name << "\"\n";
  out << "localIp     = \"" << s.scanner.localIp << "\"   # empty = detect\n";
  out << "localPort   = " << s.scanner.localPort << "\n";
  out << "broadcast   = \"" << s.scanner.broadcast << "\"\n";
  out << "defaultFile = \"" << s.scanner.defaultFile << "\"\n\n";

  out << "[agent]\n";
  out << "name            = \"" << s.agent.name << "\"\n";
  out << "bindAddress     = \"" << s.agent.bindAddress << "\"\n";
  out << "advertiseIp     = \"" << s.agent.advertiseIp << "\"\n";
  out << "storageDir      = \"" << s.agent.storageDir << "\"\n";
  out << "retention       = " << s.agent.retention << "   # 0 = keep everything\n";
  out << "decodeOnReceive = " << b2s(s.agent.decodeOnReceive) << "\n";
  out << "mode            = \"" << s.agent.mode << "\"   # terminal | forward\n";
  out << "forwardHost     = \"" << s.agent.forwardHost << "\"\n";
  out << "forwardName     = \"" << s.agent.forwardName << "\"\n\n";

  out << "[relay]\n";
  out << "applianceSubnet = \"" << s.relay.applianceSubnet << "\"\n";
  out << "receiverHost    = \"" << s.relay.receiverHost << "\"\n";
  out << "receiverUdpPort = " << s.relay.receiverUdpPort << "\n";
  out << "receiverTcpPort = " << s.relay.receiverTcpPort << "\n";
  out << "bindAddress     = \"" << s.relay.bindAddress << "\"\n";
  out << "listenUdpPort   = " << s.relay.listenUdpPort << "\n";
  out << "listenTcpPort   = " << s.relay.listenTcpPort << "\n";
  out << "replyWindowMs   = " << s.relay.replyWindowMs << "\n";
  out << "synthesizeReply = " << b2s(s.relay.synthesizeReply) << "\n";
  out << "name            = \"" << s.relay.name << "\"\n";
  out << "advertiseIp     = \"" << s.relay.advertiseIp << "\"\n";
  out << "pumpBuffer      = " << s.relay.pumpBuffer << "\n\n";

  out << "[logging]\n";
  out << "showConsole       = " << b2s(s.showConsole) << "\n";
  out << "saveLog           = " << b2s(s.saveLog) << "\n";
  out << "saveSocketLog     = " << b2s(s.saveSocketLog) << "\n";
  out << "level             = \"" << s.logLevel << "\"\n";
  out << "logsDir           = \"" << kDefaultLogsDir << "\"\n";
  out << "appLogFilename    = \"" << kDefaultAppLog << "\"\n";
  out << "socketLogFilename = \"" << kDefaultSocketLog << "\"\n";

  out.close();

  s.logsDir = kDefaultLogsDir;
  s.appLogFilename = kDefaultAppLog;
  s.socketLogFilename = kDefaultSocketLog;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // unreadable: start over from defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [network]
  // ---------------------------
  if (auto n = tbl["network"].as_table())
  {
    read(*n, "udpPort", s.network.udpPort);
    read(*n, "tcpPort", s.network.tcpPort);
    read(*n, "discoveryTimeoutMs", s.network.discoveryTimeoutMs);
    read(*n, "udpTimeoutMs", s.network.udpTimeoutMs);
    read(*n, "tcpConnectTimeoutMs", s.network.tcpConnectTimeoutMs);
    read(*n, "socketTimeoutMs", s.network.socketTimeoutMs);
    read(*n, "udpBuffer", s.network.udpBuffer);
    read(*n, "tcpChunkSize", s.network.tcpChunkSize);
    read(*n, "tcpRecvBuffer", s.network.tcpRecvBuffer);
    read(*n, "readIdleTimeoutMs", s.network.readIdleTimeoutMs);
    read(*n, "ioThreads", s.network.ioThreads);
  }
  if (s.network.ioThreads < 1) s.network.ioThreads = 1;
  if (s.network.tcpChunkSize == 0) s.network.tcpChunkSize = 8192;
  if (s.network.tcpRecvBuffer == 0) s.network.tcpRecvBuffer = 4096;
  if (s.network.udpBuffer == 0) s.network.udpBuffer = 1024;

  // ---------------------------
  // [scanner]
  // ---------------------------
  if (auto sc = tbl["scanner"].as_table())
  {
    read(*sc, "name", s.scanner.name);
    read(*sc, "localIp", s.scanner.localIp);
    read(*sc, "localPort", s.scanner.localPort);
    read(*sc, "broadcast", s.scanner.broadcast);
    read(*sc, "defaultFile", s.scanner.defaultFile);
  }

  // ---------------------------
  // [agent]
  // ---------------------------
  if (auto a = tbl["agent"].as_table())
  {
    read(*a, "name", s.agent.name);
    read(*a, "bindAddress", s.agent.bindAddress);
    read(*a, "advertiseIp", s.agent.advertiseIp);
    read(*a, "storageDir", s.agent.storageDir);
    read(*a, "retention", s.agent.retention);
    read(*a, "decodeOnReceive", s.agent.decodeOnReceive);
    read(*a, "mode", s.agent.mode);
    read(*a, "forwardHost", s.agent.forwardHost);
    read(*a, "forwardName", s.agent.forwardName);
  }
  if (s.agent.bindAddress.empty()) s.agent.bindAddress = "0.0.0.0";

  // ---------------------------
  // [relay]
  // ---------------------------
  if (auto r = tbl["relay"].as_table())
  {
    read(*r, "applianceSubnet", s.relay.applianceSubnet);
    read(*r, "receiverHost", s.relay.receiverHost);
    read(*r, "receiverUdpPort", s.relay.receiverUdpPort);
    read(*r, "receiverTcpPort", s.relay.receiverTcpPort);
    read(*r, "bindAddress", s.relay.bindAddress);
    read(*r, "listenUdpPort", s.relay.listenUdpPort);
    read(*r, "listenTcpPort", s.relay.listenTcpPort);
    read(*r, "replyWindowMs", s.relay.replyWindowMs);
    read(*r, "synthesizeReply", s.relay.synthesizeReply);
    read(*r, "name", s.relay.name);
    read(*r, "advertiseIp", s.relay.advertiseIp);
    read(*r, "pumpBuffer", s.relay.pumpBuffer);
  }
  if (s.relay.bindAddress.empty()) s.relay.bindAddress = "0.0.0.0";
  if (s.relay.pumpBuffer == 0) s.relay.pumpBuffer = 4096;

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    read(*log, "showConsole", s.showConsole);
    read(*log, "saveLog", s.saveLog);
    read(*log, "saveSocketLog", s.saveSocketLog);
    read(*log, "level", s.logLevel);
    read(*log, "logsDir", s.logsDir);
    read(*log, "appLogFilename", s.appLogFilename);
    read(*log, "socketLogFilename", s.socketLogFilename);
  }

  if (s.logsDir.empty()) s.logsDir = kDefaultLogsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaultAppLog;
  if (s.socketLogFilename.empty()) s.socketLogFilename = kDefaultSocketLog;

  return s;
}

}  // namespace scanbridge::infrastructure::config
