#include "settle/price/feed_price_guard.hpp"

#include "settle/domain/errors.hpp"

#include <mutex>

namespace settle {

domain::SecuredPrice FeedPriceGuard::getSecuredPrice() const {
  std::shared_lock lock(mutex_);
  if (!latest_.has_value()) {
    throw PriceGuardError("No price received from the feed yet");
  }
  return *latest_;
}

void FeedPriceGuard::update(const domain::SecuredPrice& price) {
  std::unique_lock lock(mutex_);
  latest_ = price;
}

void FeedPriceGuard::clear() {
  std::unique_lock lock(mutex_);
  latest_.reset();
}

}  // namespace settle
