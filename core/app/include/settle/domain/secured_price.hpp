#pragma once

#include "settle/domain/transfer.hpp"

#include <cstdint>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// SecuredPrice: result of IPriceGuard::getSecuredPrice()
// -----------------------------------------------------------------------------
//
// @brief  Aggregated price as reported by the external price guard.
//
// @details
// price and twap are fixed-point values with kPriceDecimals decimals.
// confidence_score is 0..100. is_secure is the guard's own verdict (e.g. its
// quorum of sources agreed). timestamp_ms is when the guard produced the
// value; the engine rejects values older than the configured staleness bound.
// -----------------------------------------------------------------------------
struct SecuredPrice {
  Price price{0};
  Price twap{0};
  int confidence_score{0};
  bool is_secure{false};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace settle
