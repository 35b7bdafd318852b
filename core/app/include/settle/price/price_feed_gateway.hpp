#pragma once

#include "settle/domain/secured_price.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <string>

namespace settle {

// -----------------------------------------------------------------------------
// PriceFeedGateway: ZeroMQ subscriber for secured price ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON price ticks and hands each
//         decoded tick to a sink (FeedPriceGuard::update in the daemon).
//
// @details
// Expected JSON format from the publisher:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "price":        4215000000000,   // fixed point, 8 decimals
//     "twap":         4209000000000,   // fixed point, 8 decimals
//     "confidence":   92,              // 0..100
//     "is_secure":    true
//   }
//
// Malformed ticks are logged to stderr and skipped; the previous price stays
// in effect.
//
// Thread model:
//   run() blocks the calling thread until stop() is called from any other
//   thread (or a signal handler). The SUB socket has a receive timeout so the
//   stop flag is checked at least every kRecvTimeoutMs.
//
// Ownership:
//   Owns the ZMQ context and socket (RAII). Holds a copy of the sink.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  using TickSink = std::function<void(const domain::SecuredPrice&)>;

  // Creates the SUB socket, subscribes to everything and connects.
  explicit PriceFeedGateway(TickSink sink,
                            const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~PriceFeedGateway() = default;

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  // Blocking receive loop. Returns after stop().
  void run();

  // Safe from any thread.
  void stop();

  // -------------------------------------------------------------------------
  // parseTick(payload)
  // -------------------------------------------------------------------------
  // Decodes one JSON tick. Throws nlohmann::json::exception when the payload
  // is not JSON or a field is missing or has the wrong type, and
  // ValidationError when confidence is outside 0..100.
  // -------------------------------------------------------------------------
  static domain::SecuredPrice parseTick(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  TickSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

}  // namespace settle
