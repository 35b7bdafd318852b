#pragma once

#include "settle/domain/transfer.hpp"

#include <vector>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// EscrowAccount: FundLedger record for one settlement
// -----------------------------------------------------------------------------
//
// @details
//   total_amount   cap on deposited (copied from the settlement at open()).
//   deposited      cumulative funds received. Reset to 0 when refunded.
//   released       funds paid out to transfer recipients.
//   contributions  per-depositor totals in first-deposit order.
//   closed         set by a refund; a closed account accepts no movement.
//
// While open: released <= deposited <= total_amount.
// -----------------------------------------------------------------------------
struct EscrowAccount {
  Amount total_amount{0};
  Amount deposited{0};
  Amount released{0};
  bool closed{false};
  std::vector<Contribution> contributions;
};

}  // namespace domain
}  // namespace settle
