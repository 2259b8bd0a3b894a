#include "application/services/AgentService.hpp"

#include <boost/asio/post.hpp>
#include <chrono>
#include <string>

using scanbridge::application::ports::LogLevel;

namespace scanbridge::application::services
{

bool AgentService::start()
{
  if (running_) return true;

  if (cfg_.agent.mode != "terminal" && cfg_.agent.mode != "forward")
  {
    log_.app(LogLevel::err, "Unknown agent.mode '" + cfg_.agent.mode +
                                "' (expected terminal or forward); aborting.");
    return false;
  }

  const bool forwarding = cfg_.agent.mode == "forward";
  if (forwarding && cfg_.agent.forwardHost.empty())
  {
    log_.app(LogLevel::err, "Forward mode needs agent.forwardHost; aborting.");
    return false;
  }

  // ---- observability ----
  responder_.on_frame = [this](const domain::protocol::ProtocolFrame& f, const std::string& from)
  {
    log_.app(LogLevel::info, std::string("Answered ") + std::string(domain::protocol::to_string(f.type)) +
                                 " from " + from + " ('" + f.srcName + "')");
  };

  // ---- completed receives leave the io threads here ----
  worker_.emplace(1);
  receiver_.on_complete = [this](const ports::ReceivedScan& scan)
  {
    if (!scan.complete || !worker_) return;
    boost::asio::post(*worker_, [this, scan] { post_process(scan); });
  };

  if (!responder_.start() || !receiver_.start())
  {
    log_.app(LogLevel::err, "Agent listeners failed to start; aborting.");
    responder_.stop();
    receiver_.stop();
    worker_->join();
    worker_.reset();
    return false;
  }

  running_ = true;
  log_.app(LogLevel::info, "AgentService started (" + cfg_.agent.mode + ", udp " +
                               std::to_string(responder_.local_port()) + ", tcp " +
                               std::to_string(receiver_.local_port()) + ").");
  return true;
}

void AgentService::stop()
{
  if (!running_) return;

  responder_.stop();
  receiver_.stop();
  if (worker_)
  {
    worker_->join();
    worker_.reset();
  }

  running_ = false;
  log_.app(LogLevel::info, "AgentService stopped");
}

void AgentService::post_process(const ports::ReceivedScan& scan)
{
  if (cfg_.agent.mode == "forward")
    forward(scan.path);
  else if (cfg_.agent.decodeOnReceive)
    decode(scan.path);
}

// decoder failures leave the raw file in place
void AgentService::decode(const std::string& path)
{
  try
  {
    const auto info = decoder_.inspect(path);
    log_.app(LogLevel::info, "Scan " + path + ": " + info.scanType + ", " + info.quality + ", " +
                                 info.format + ", " + std::to_string(info.width) + "x" +
                                 std::to_string(info.height) + " (row " +
                                 std::to_string(info.rowSize) + " B)");
  }
  catch (const std::exception& e)
  {
    log_.app(LogLevel::warn, "Decoder rejected " + path + ": " + e.what() + " (raw file kept)");
  }
}

void AgentService::forward(const std::string& path)
{
  ports::TransferRequest req;
  req.localIp = route_.local_address_for(cfg_.agent.forwardHost);
  req.localPort = cfg_.scanner.localPort;
  req.targetIp = cfg_.agent.forwardHost;
  req.udpPort = cfg_.network.udpPort;
  req.tcpPort = cfg_.network.tcpPort;
  req.sourceName = cfg_.agent.forwardName;
  req.filePath = path;
  req.udpTimeout = std::chrono::milliseconds(cfg_.network.udpTimeoutMs);
  req.tcpTimeout = std::chrono::milliseconds(cfg_.network.tcpConnectTimeoutMs);
  req.pollInterval = std::chrono::milliseconds(cfg_.network.socketTimeoutMs);
  req.chunkSize = cfg_.network.tcpChunkSize;

  const auto res = forwarder_.send(req);
  if (res.ok)
    log_.app(LogLevel::info, "Forwarded " + path + " to " + req.targetIp + " (" +
                                 std::to_string(res.bytesSent) + " bytes)");
  else
    log_.app(LogLevel::err, "Forward of " + path + " to " + req.targetIp + " failed: " + res.error);
}

}  // namespace scanbridge::application::services
