#pragma once

#include <cstddef>

#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/ITransferClient.hpp"

namespace scanbridge::infrastructure::net
{

// UDP rendezvous on the discovery port, then the file as a bare TCP stream.
// End of stream is the only completion signal the responder gets.
class TransferClient_Asio final : public scanbridge::application::ports::ITransferClient
{
 public:
  TransferClient_Asio(const application::ports::IFrameCodec& codec,
                      application::ports::ILogger& log, std::size_t recv_buffer = 1024)
      : codec_(codec), log_(log), recv_buffer_(recv_buffer)
  {
  }

  application::ports::TransferResult send(const application::ports::TransferRequest& req) override;

 private:
  bool rendezvous(const application::ports::TransferRequest& req,
                  application::ports::TransferResult& out);
  bool stream(const application::ports::TransferRequest& req,
              application::ports::TransferResult& out);

  const application::ports::IFrameCodec& codec_;
  application::ports::ILogger& log_;
  std::size_t recv_buffer_;
};

}  // namespace scanbridge::infrastructure::net
