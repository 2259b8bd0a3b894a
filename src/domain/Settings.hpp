#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace scanbridge::domain
{

struct Settings
{
  struct Network
  {
    uint16_t udpPort{706};
    uint16_t tcpPort{708};
    int discoveryTimeoutMs{10000};
    int udpTimeoutMs{5000};
    int tcpConnectTimeoutMs{10000};
    int socketTimeoutMs{1000};  // poll interval of blocking client receives
    std::size_t udpBuffer{1024};
    std::size_t tcpChunkSize{8192};
    std::size_t tcpRecvBuffer{4096};
    int readIdleTimeoutMs{0};  // 0 = wait for the peer to close
    int ioThreads{2};
  } network;

  // Client role (the side that plays the appliance)
  struct Scanner
  {
    std::string name{"Scanner"};
    std::string localIp;  // empty = detect from the route to the target
    uint16_t localPort{706};
    std::string broadcast{"255.255.255.255"};
    std::string defaultFile{"files/scan.raw"};
  } scanner;

  // Responder role
  struct Agent
  {
    std::string name{"Agent"};
    std::string bindAddress{"0.0.0.0"};
    std::string advertiseIp;  // empty = local address facing the requester
    std::string storageDir{"files"};
    std::size_t retention{10};
    bool decodeOnReceive{true};
    std::string mode{"terminal"};  // "terminal" | "forward"
    std::string forwardHost;
    std::string forwardName{"Scanner"};
  } agent;

  struct Relay
  {
    std::string applianceSubnet{"10.0.52.0/24"};
    std::string receiverHost{"192.168.50.173"};
    uint16_t receiverUdpPort{706};
    uint16_t receiverTcpPort{708};
    std::string bindAddress{"0.0.0.0"};
    uint16_t listenUdpPort{706};
    uint16_t listenTcpPort{708};
    int replyWindowMs{1000};
    bool synthesizeReply{true};
    std::string name{"Relay"};
    std::string advertiseIp;
    std::size_t pumpBuffer{4096};
  } relay;

  // Console / Logs
  bool showConsole{true};
  bool saveLog{true};
  bool saveSocketLog{true};
  std::string logLevel{"info"};
  std::string logsDir{"logs"};
  std::string appLogFilename{"scanbridge_app.log"};
  std::string socketLogFilename{"scanbridge_socket.log"};
  std::string configPath{"scanbridge.toml"};
};

}  // namespace scanbridge::domain
