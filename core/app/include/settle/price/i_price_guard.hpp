#pragma once

#include "settle/domain/secured_price.hpp"

namespace settle {

// -----------------------------------------------------------------------------
// IPriceGuard: source of secured prices
// -----------------------------------------------------------------------------
//
// @brief  The single call SettlementEngine makes when a price-denominated
//         settlement is initiated.
//
// @details
// getSecuredPrice() is synchronous. It throws when no price can be produced;
// SettlementEngine converts any such failure into PriceGuardError and aborts
// the initiate() without having changed anything. The engine applies its own
// acceptance policy (confidence, staleness, TWAP deviation, bounds) to the
// returned value; implementations only report what they have.
//
// Implementations:
//   FeedPriceGuard  latest tick received over the price feed (daemon).
//   Test doubles    fixed or scripted values.
// -----------------------------------------------------------------------------
class IPriceGuard {
 public:
  virtual ~IPriceGuard() = default;

  virtual domain::SecuredPrice getSecuredPrice() const = 0;
};

}  // namespace settle
