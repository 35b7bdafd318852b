#pragma once

#include "settle/domain/secured_price.hpp"
#include "settle/price/i_price_guard.hpp"

#include <optional>
#include <shared_mutex>

namespace settle {

// -----------------------------------------------------------------------------
// FeedPriceGuard
// -----------------------------------------------------------------------------
// Responsibility: IPriceGuard backed by the most recent tick pushed by the
// PriceFeedGateway. Until the first tick arrives (or after clear()),
// getSecuredPrice() throws PriceGuardError.
//
// Thread model: update()/clear() run on the feed thread, getSecuredPrice()
// on whichever thread is running SettlementEngine::initiate(). A
// shared_mutex lets concurrent readers proceed while a writer is exclusive.
// -----------------------------------------------------------------------------
class FeedPriceGuard final : public IPriceGuard {
 public:
  FeedPriceGuard() = default;

  FeedPriceGuard(const FeedPriceGuard&) = delete;
  FeedPriceGuard& operator=(const FeedPriceGuard&) = delete;

  domain::SecuredPrice getSecuredPrice() const override;

  void update(const domain::SecuredPrice& price);
  void clear();

 private:
  mutable std::shared_mutex mutex_;
  std::optional<domain::SecuredPrice> latest_;
};

}  // namespace settle
