#pragma once
#include <boost/asio/thread_pool.hpp>
#include <optional>

#include "application/ports/IListener.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IRawDecoder.hpp"
#include "application/ports/IRouteProbe.hpp"
#include "application/ports/ITransferClient.hpp"
#include "domain/Settings.hpp"

namespace scanbridge::application::services
{

// Receiving agent: UDP responder + TCP receiver. Completed scans are decoded
// (terminal mode) or re-sent to another agent (forward mode) on a worker so the
// receive path never waits on them.
class AgentService
{
 public:
  AgentService(ports::IFrameResponder& responder, ports::IScanReceiver& receiver,
               ports::IRawDecoder& decoder, ports::ITransferClient& forwarder,
               ports::IRouteProbe& route, ports::ILogger& logger, const domain::Settings& s)
      : responder_(responder),
        receiver_(receiver),
        decoder_(decoder),
        forwarder_(forwarder),
        route_(route),
        log_(logger),
        cfg_(s)
  {
  }
  ~AgentService() { stop(); }

  bool start();
  void stop();
  bool running() const { return running_; }

 private:
  void post_process(const ports::ReceivedScan& scan);
  void decode(const std::string& path);
  void forward(const std::string& path);

  ports::IFrameResponder& responder_;
  ports::IScanReceiver& receiver_;
  ports::IRawDecoder& decoder_;
  ports::ITransferClient& forwarder_;
  ports::IRouteProbe& route_;
  ports::ILogger& log_;
  const domain::Settings& cfg_;

  std::optional<boost::asio::thread_pool> worker_;
  bool running_{false};
};

}  // namespace scanbridge::application::services
