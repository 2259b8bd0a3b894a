#pragma once
#include <sstream>
#include <string>

#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"

namespace scanbridge::application::services {

struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }
  static inline std::string or_auto(const std::string& v) { return v.empty() ? "auto" : v; }

  // Loads (or creates) the config, brings logging up and prints the summary
  // for `role`. The returned settings are handed to every component.
  domain::Settings run(const std::string& configPath, const std::string& role) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;

    log.app(LogLevel::info, "scanbridge started, role: " + role);
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);

    std::ostringstream net;
    net << "UDP " << s.network.udpPort << " | TCP " << s.network.tcpPort
        << " | io threads " << s.network.ioThreads;
    log.app(LogLevel::info, net.str());

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveSocketLog: " << b2s(s.saveSocketLog)
          << " | level: " << s.logLevel;
    log.app(LogLevel::info, flags.str());

    if (role == "agent") {
      log.app(LogLevel::info, "agent name     = " + s.agent.name);
      log.app(LogLevel::info, "agent mode     = " + s.agent.mode);
      log.app(LogLevel::info, "storage        = " + s.agent.storageDir + " (keep " +
                                  std::to_string(s.agent.retention) + ")");
      log.app(LogLevel::info, "advertise ip   = " + or_auto(s.agent.advertiseIp));
      if (s.agent.mode == "forward")
        log.app(LogLevel::info, "forward to     = " + s.agent.forwardHost + " as '" +
                                    s.agent.forwardName + "'");
    } else if (role == "relay") {
      log.app(LogLevel::info, "appliance net  = " + s.relay.applianceSubnet);
      log.app(LogLevel::info, "receiver       = " + s.relay.receiverHost + " udp " +
                                  std::to_string(s.relay.receiverUdpPort) + " tcp " +
                                  std::to_string(s.relay.receiverTcpPort));
      log.app(LogLevel::info, std::string("synthesize     = ") + b2s(s.relay.synthesizeReply));
    } else {
      log.app(LogLevel::info, "scanner name   = " + s.scanner.name);
      log.app(LogLevel::info, "local ip       = " + or_auto(s.scanner.localIp));
    }
    return s;
  }
};

} // namespace scanbridge::application::services
