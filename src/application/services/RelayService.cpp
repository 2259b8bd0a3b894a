#include "application/services/RelayService.hpp"

#include <string>

using scanbridge::application::ports::LogLevel;
using scanbridge::application::ports::RelayDirection;

namespace scanbridge::application::services
{

bool RelayService::start()
{
  if (running_) return true;

  udp_.on_datagram = [this](const ports::RelayedDatagram& d)
  {
    switch (d.direction)
    {
      case RelayDirection::to_receiver:
        ++to_receiver_;
        break;
      case RelayDirection::to_appliance:
        ++to_appliance_;
        break;
      case RelayDirection::synthesized:
        ++synthesized_;
        break;
    }
  };

  tcp_.on_session_closed = [this](const ports::RelaySessionStats& st)
  {
    ++sessions_;
    if (!st.relayed || !st.error.empty()) ++failed_;
    bytes_to_receiver_ += st.toReceiver;
    bytes_to_appliance_ += st.toAppliance;
  };

  if (!udp_.start() || !tcp_.start())
  {
    log_.app(LogLevel::err, "Relay listeners failed to start; aborting.");
    udp_.stop();
    tcp_.stop();
    return false;
  }

  running_ = true;
  log_.app(LogLevel::info, "RelayService started (" + cfg_.relay.applianceSubnet + " <-> " +
                               cfg_.relay.receiverHost + ").");
  return true;
}

void RelayService::stop()
{
  if (!running_) return;

  udp_.stop();
  tcp_.stop();
  running_ = false;

  const auto t = totals();
  log_.app(LogLevel::info,
           "RelayService stopped: " + std::to_string(t.datagramsToReceiver) + " datagrams forwarded, " +
               std::to_string(t.datagramsToAppliance) + " replies relayed, " +
               std::to_string(t.synthesizedReplies) + " synthesized, " +
               std::to_string(t.sessions) + " tcp sessions (" + std::to_string(t.failedSessions) +
               " failed), " + std::to_string(t.bytesToReceiver) + "/" +
               std::to_string(t.bytesToAppliance) + " bytes");
}

RelayTotals RelayService::totals() const
{
  RelayTotals t;
  t.datagramsToReceiver = to_receiver_;
  t.datagramsToAppliance = to_appliance_;
  t.synthesizedReplies = synthesized_;
  t.sessions = sessions_;
  t.failedSessions = failed_;
  t.bytesToReceiver = bytes_to_receiver_;
  t.bytesToAppliance = bytes_to_appliance_;
  return t;
}

}  // namespace scanbridge::application::services
