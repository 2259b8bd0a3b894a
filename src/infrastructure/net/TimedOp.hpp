#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>

namespace scanbridge::infrastructure::net
{

struct TimedResult
{
  boost::system::error_code ec;
  std::size_t bytes{0};
  bool timedOut{false};
};

// Completion for both (ec) and (ec, n) signatures.
struct StoreCompletion
{
  TimedResult* r;
  void operator()(const boost::system::error_code& ec) const { r->ec = ec; }
  void operator()(const boost::system::error_code& ec, std::size_t n) const
  {
    r->ec = ec;
    r->bytes = n;
  }
};

// -----------------------------------------------------------------------------
// run_timed(io, socket, limit, initiate)
//  - starts one async operation through `initiate(handler)` and drives `io`
//    for at most `limit`
//  - on expiry the socket is cancelled and the aborted handler is drained, so
//    the socket is idle again when this returns
// -----------------------------------------------------------------------------
template <class Socket, class Initiate>
TimedResult run_timed(boost::asio::io_context& io, Socket& socket,
                      std::chrono::steady_clock::duration limit, Initiate&& initiate)
{
  TimedResult r;
  r.ec = boost::asio::error::would_block;

  io.restart();
  initiate(StoreCompletion{&r});
  io.run_for(limit);

  if (!io.stopped())
  {
    boost::system::error_code ignored;
    socket.cancel(ignored);
    io.run();
    if (r.ec == boost::asio::error::operation_aborted) r.timedOut = true;
  }
  return r;
}

}  // namespace scanbridge::infrastructure::net
