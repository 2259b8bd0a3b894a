#pragma once
#include <atomic>
#include <cstdint>

#include "application/ports/ILogger.hpp"
#include "application/ports/IRelay.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::application::services
{

struct RelayTotals
{
  std::uint64_t datagramsToReceiver{0};
  std::uint64_t datagramsToAppliance{0};
  std::uint64_t synthesizedReplies{0};
  std::uint64_t sessions{0};
  std::uint64_t failedSessions{0};
  std::uint64_t bytesToReceiver{0};
  std::uint64_t bytesToAppliance{0};
};

class RelayService
{
 public:
  RelayService(ports::IDatagramRelay& udp, ports::IStreamRelay& tcp, ports::ILogger& logger,
               const domain::Settings& s)
      : udp_(udp), tcp_(tcp), log_(logger), cfg_(s)
  {
  }
  ~RelayService() { stop(); }

  bool start();
  void stop();
  RelayTotals totals() const;

 private:
  ports::IDatagramRelay& udp_;
  ports::IStreamRelay& tcp_;
  ports::ILogger& log_;
  const domain::Settings& cfg_;
  bool running_{false};

  std::atomic<std::uint64_t> to_receiver_{0};
  std::atomic<std::uint64_t> to_appliance_{0};
  std::atomic<std::uint64_t> synthesized_{0};
  std::atomic<std::uint64_t> sessions_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> bytes_to_receiver_{0};
  std::atomic<std::uint64_t> bytes_to_appliance_{0};
};

}  // namespace scanbridge::application::services
