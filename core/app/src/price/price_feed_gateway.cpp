#include "settle/price/price_feed_gateway.hpp"

#include "settle/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace settle {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
PriceFeedGateway::PriceFeedGateway(TickSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void PriceFeedGateway::run() {
  running_.store(true);

  while (running_.load() && !stop_requested_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;  // Timeout; re-check the stop flag.
    }

    std::string payload = msg.to_string();
    try {
      sink_(parseTick(payload));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[PriceFeedGateway] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    } catch (const ValidationError& e) {
      std::cerr << "[PriceFeedGateway] rejected tick: " << e.what()
                << " payload: " << payload << "\n";
    }
  }

  running_.store(false);
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PriceFeedGateway::stop() {
  stop_requested_.store(true);
  running_.store(false);
}

// -----------------------------------------------------------------------------
// parseTick()
// -----------------------------------------------------------------------------
domain::SecuredPrice PriceFeedGateway::parseTick(const std::string& payload) {
  auto json = nlohmann::json::parse(payload);

  domain::SecuredPrice tick;
  tick.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
  tick.price = json.at("price").get<domain::Price>();
  tick.twap = json.at("twap").get<domain::Price>();
  tick.confidence_score = json.at("confidence").get<int>();
  tick.is_secure = json.at("is_secure").get<bool>();

  if (tick.confidence_score < 0 || tick.confidence_score > 100) {
    throw ValidationError("Confidence out of range: " +
                          std::to_string(tick.confidence_score));
  }
  return tick;
}

}  // namespace settle
