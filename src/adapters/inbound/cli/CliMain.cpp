#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <string>

#include "application/services/AgentService.hpp"
#include "application/services/Bootstrap.hpp"
#include "application/services/RelayService.hpp"
#include "application/services/ScannerService.hpp"
#include "domain/Errors.hpp"
#include "domain/protocol/ProtocolFrame.hpp"
#include "infrastructure/codec/FrameCodec_Scanner.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/decoder/RawDecoder_Header.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/net/DiscoveryClient_Asio.hpp"
#include "infrastructure/net/FrameResponder_Asio.hpp"
#include "infrastructure/net/RouteProbe_Udp.hpp"
#include "infrastructure/net/TcpRelay_Asio.hpp"
#include "infrastructure/net/TransferClient_Asio.hpp"
#include "infrastructure/net/TransferReceiver_Asio.hpp"
#include "infrastructure/net/UdpRelay_Asio.hpp"
#include "infrastructure/storage/ScanStore_Fs.hpp"

namespace app = scanbridge::application;
namespace infra = scanbridge::infrastructure;

namespace
{

int usage()
{
  std::cerr << "usage: scanbridge agent    [config.toml]\n"
               "       scanbridge relay    [config.toml]\n"
               "       scanbridge discover [config.toml]\n"
               "       scanbridge send     [config.toml] <target-ip> [file] [dest-name]\n";
  return 2;
}

// Blocks until SIGINT or SIGTERM.
void wait_for_signal()
{
  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code&, int) {});
  io.run();
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc < 2) return usage();

  const std::string role = argv[1];
  const std::string configPath = (argc > 2) ? argv[2] : std::string{"scanbridge.toml"};

  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;
  infra::codec::FrameCodec_Scanner codec;
  infra::net::RouteProbe_Udp route;

  app::services::Bootstrap boot{cfg_impl, log_impl};
  const auto s = boot.run(configPath, role);

  // names go on the wire in every reply; refuse to start with one that cannot
  try
  {
    using infra::codec::FrameCodec_Scanner;
    namespace layout = scanbridge::domain::protocol::layout;
    FrameCodec_Scanner::check_name(s.agent.name, layout::kDstNameSize, "agent.name");
    FrameCodec_Scanner::check_name(s.relay.name, layout::kDstNameSize, "relay.name");
    FrameCodec_Scanner::check_name(s.scanner.name, layout::kSrcNameSize, "scanner.name");
    FrameCodec_Scanner::check_name(s.agent.forwardName, layout::kSrcNameSize, "agent.forwardName");
  }
  catch (const scanbridge::domain::EncodingError& e)
  {
    log_impl.app(app::ports::LogLevel::critical, std::string("Invalid configuration: ") + e.what());
    std::cerr << "invalid configuration: " << e.what() << "\n";
    return 1;
  }

  if (role == "agent")
  {
    infra::storage::ScanStore_Fs store(s.agent.storageDir, s.agent.retention, log_impl);
    infra::decoder::RawDecoder_Header decoder;
    infra::net::FrameResponder_Asio responder(s, codec, log_impl);
    infra::net::TransferReceiver_Asio receiver(s, store, log_impl);
    infra::net::TransferClient_Asio forwarder(codec, log_impl, s.network.udpBuffer);

    app::services::AgentService agent(responder, receiver, decoder, forwarder, route, log_impl, s);
    if (!agent.start()) return 1;

    std::cout << "Agent '" << s.agent.name << "' up. Ctrl+C to stop.\n";
    wait_for_signal();
    agent.stop();
    return 0;
  }

  if (role == "relay")
  {
    infra::net::UdpRelay_Asio udp(s, codec, log_impl);
    infra::net::TcpRelay_Asio tcp(s, log_impl);

    app::services::RelayService relay(udp, tcp, log_impl, s);
    if (!relay.start()) return 1;

    std::cout << "Relay up (" << s.relay.applianceSubnet << " <-> " << s.relay.receiverHost
              << "). Ctrl+C to stop.\n";
    wait_for_signal();
    relay.stop();
    return 0;
  }

  infra::net::DiscoveryClient_Asio discovery(codec, log_impl, s.network.udpBuffer);
  infra::net::TransferClient_Asio transfer(codec, log_impl, s.network.udpBuffer);
  app::services::ScannerService scanner(discovery, transfer, route, log_impl, s);

  if (role == "discover")
  {
    const auto res = scanner.discover();
    if (!res.ok)
    {
      std::cerr << "discovery failed: " << res.error << "\n";
      return 1;
    }
    std::cout << res.agents.size() << " agent(s) found\n";
    for (const auto& a : res.agents)
    {
      std::cout << "  " << a.address << "  name='" << a.frame.dstName << "'  ip="
                << scanbridge::domain::protocol::format_ipv4(a.frame.initiatorIp) << "\n";
    }
    return 0;
  }

  if (role == "send")
  {
    if (argc < 4) return usage();
    const std::string target = argv[3];
    const std::string file = (argc > 4) ? argv[4] : std::string{};
    const std::string dest = (argc > 5) ? argv[5] : std::string{};

    const auto res = scanner.send(target, file, dest,
                                  [](std::uint64_t sent, std::uint64_t total)
                                  {
                                    const auto pct = total ? sent * 100 / total : 100;
                                    std::cout << "\r" << sent << "/" << total << " bytes ("
                                              << pct << "%)" << std::flush;
                                  });
    std::cout << "\n";
    if (!res.ok)
    {
      std::cerr << "transfer failed: " << res.error << "\n";
      return 1;
    }
    std::cout << "sent " << res.bytesSent << " bytes"
              << (res.ack ? ", acknowledged by '" + res.ack->dstName + "'" : std::string(", no ack"))
              << "\n";
    return 0;
  }

  return usage();
}
