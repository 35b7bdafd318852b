#include "settle/price/price_policy.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace settle {

namespace {

using WideInt = __int128;

}  // namespace

std::optional<std::string> evaluatePrice(const domain::SecuredPrice& price,
                                         const domain::EscrowConfig& config,
                                         std::int64_t now_ms) {
  if (!price.is_secure) {
    return std::string("Price not secure");
  }
  if (price.confidence_score < config.min_confidence_score) {
    return "Low confidence score: " + std::to_string(price.confidence_score) +
           " < " + std::to_string(config.min_confidence_score);
  }
  if (price.timestamp_ms > now_ms &&
      price.timestamp_ms - now_ms > config.max_price_clock_skew_ms) {
    return "Price timestamp in the future: " +
           std::to_string(price.timestamp_ms - now_ms) + " ms ahead";
  }
  if (now_ms > price.timestamp_ms &&
      now_ms - price.timestamp_ms > config.max_price_staleness_ms) {
    return "Stale price: " + std::to_string(now_ms - price.timestamp_ms) +
           " ms old";
  }
  if (price.twap > 0) {
    // |price - twap| < 2^64, so the scaled difference fits in 128 bits.
    WideInt diff = static_cast<WideInt>(price.price) - price.twap;
    if (diff < 0) {
      diff = -diff;
    }
    if (diff * 10'000 >
        static_cast<WideInt>(config.max_twap_deviation_bps) * price.twap) {
      const WideInt bps = diff * 10'000 / price.twap;
      return "Price deviates from TWAP by " +
             std::to_string(static_cast<long long>(
                 std::min<WideInt>(bps, std::numeric_limits<long long>::max()))) +
             " bps";
    }
  }
  return checkPriceBounds(price.price, config);
}

std::optional<std::string> checkPriceBounds(domain::Price price,
                                            const domain::EscrowConfig& config) {
  if (price < config.min_price) {
    return "Price below minimum: " + std::to_string(price);
  }
  if (price > config.max_price) {
    return "Price above maximum: " + std::to_string(price);
  }
  return std::nullopt;
}

}  // namespace settle
