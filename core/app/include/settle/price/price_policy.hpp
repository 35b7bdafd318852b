#pragma once

#include "settle/domain/escrow_config.hpp"
#include "settle/domain/secured_price.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace settle {

// -----------------------------------------------------------------------------
// Price acceptance policy
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a SecuredPrice may be locked into a settlement.
//
// @details
// evaluatePrice() returns std::nullopt when the price is acceptable, or a
// short human-readable reason for the first failed check. Checks, in order:
//   1. is_secure must be true.
//   2. confidence_score >= config.min_confidence_score.
//   3. timestamp_ms - now_ms <= config.max_price_clock_skew_ms and
//      now_ms - timestamp_ms <= config.max_price_staleness_ms.
//   4. |price - twap| * 10000 / twap <= config.max_twap_deviation_bps
//      (skipped when twap <= 0).
//   5. price within [config.min_price, config.max_price].
//
// Used by SettlementEngine::initiate() (which turns a reason into a
// PriceGuardError) and by canInitiate() (which reports it).
// -----------------------------------------------------------------------------
std::optional<std::string> evaluatePrice(const domain::SecuredPrice& price,
                                         const domain::EscrowConfig& config,
                                         std::int64_t now_ms);

// Check 5 alone; applied to admin manual prices, which bypass the feed.
std::optional<std::string> checkPriceBounds(domain::Price price,
                                            const domain::EscrowConfig& config);

}  // namespace settle
