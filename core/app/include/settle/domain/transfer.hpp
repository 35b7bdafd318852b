#pragma once

#include <cstdint>
#include <string>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// Identity and quantity aliases
// -----------------------------------------------------------------------------
// SettlementId: assigned by the SettlementRegistry, starts at 1, never reused.
// Amount:       integer smallest-unit quantity. No floating point anywhere in
//               the accounting path; every bounded add/subtract is checked.
// Address:      opaque caller / account identity (e.g. "0xA11CE..." or "alice").
// Price:        fixed-point price with kPriceDecimals implied decimals.
// -----------------------------------------------------------------------------
using SettlementId = std::uint64_t;
using Amount = std::uint64_t;
using Address = std::string;
using Price = std::int64_t;

inline constexpr int kPriceDecimals = 8;
inline constexpr Price kPricePrecision = 100'000'000;

// -----------------------------------------------------------------------------
// Transfer
// -----------------------------------------------------------------------------
//
// @brief  One line item of a settlement: move `amount` from `from` to `to`.
//
// @details
// `executed` flips false -> true exactly once, when the transfer is paid out
// of escrow by SettlementEngine::execute(). It never reverts.
// -----------------------------------------------------------------------------
struct Transfer {
  Address from;
  Address to;
  Amount amount{0};
  bool executed{false};
};

// -----------------------------------------------------------------------------
// Contribution
// -----------------------------------------------------------------------------
// A (party, amount) pair. Used for per-depositor deposit totals inside the
// FundLedger and for the refund list returned by refund / force-fail.
// -----------------------------------------------------------------------------
struct Contribution {
  Address party;
  Amount amount{0};
};

}  // namespace domain
}  // namespace settle
