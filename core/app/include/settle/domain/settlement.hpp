#pragma once

#include "settle/domain/settlement_state.hpp"
#include "settle/domain/transfer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// DisputeOutcome
// -----------------------------------------------------------------------------
// Decision delivered by the external authority (admin) for a Disputed
// settlement. The core only applies it; it never decides it.
// -----------------------------------------------------------------------------
enum class DisputeOutcome {
  Resume,     // Back to the state the settlement was in when disputed
  ForceFail,  // Refund unreleased escrow to depositors, state -> Failed
};

// "RESUME" / "FORCE_FAIL".
const char* disputeOutcomeToString(DisputeOutcome outcome);
std::optional<DisputeOutcome> disputeOutcomeFromString(const std::string& name);

// -----------------------------------------------------------------------------
// Settlement
// -----------------------------------------------------------------------------
//
// @brief  One funded batch of transfers, processed as a single unit of the
//         fair-ordering queue.
//
// @details
// Field ownership:
//   - id, initiator, total_amount, created_at_ms, timeout_ms, transfers'
//     from/to/amount and requires_price are fixed by SettlementRegistry at
//     creation time and never change afterwards.
//   - total_deposited mirrors the FundLedger account for this id. It only
//     grows, except that a refund resets it to zero.
//   - queue_position is assigned once, at initiate().
//   - executed_transfers counts executed line items; transfers are always
//     executed in array order, so transfers[0 .. executed_transfers) are the
//     executed ones.
//
// Copies handed out by SettlementEngine queries are snapshots; the
// authoritative record lives inside the registry.
// -----------------------------------------------------------------------------
struct Settlement {
  SettlementId id{0};
  Address initiator;
  Amount total_amount{0};
  Amount total_deposited{0};
  SettlementState state{SettlementState::Pending};

  std::int64_t created_at_ms{0};
  std::int64_t timeout_ms{0};  // Duration; refund eligible after the deadline

  std::optional<std::uint64_t> queue_position;
  std::uint32_t total_transfers{0};
  std::uint32_t executed_transfers{0};

  // Price-denominated settlements must pass the price guard at initiate().
  bool requires_price{false};
  std::optional<Price> locked_price;  // Price accepted at initiate()
  std::optional<Price> manual_price;  // Admin override, used instead of the guard

  std::int64_t initiated_at_ms{0};
  std::int64_t finalized_at_ms{0};

  // Dispute bookkeeping. state_before_dispute is set while Disputed.
  std::string dispute_reason;
  Address disputed_by;
  std::optional<SettlementState> state_before_dispute;

  std::vector<Transfer> transfers;

  // Absolute refund deadline: created_at_ms + timeout_ms. Refund is
  // permitted once now_ms is strictly greater than this value.
  std::int64_t deadline_ms() const { return created_at_ms + timeout_ms; }

  std::uint32_t remaining_transfers() const {
    return total_transfers - executed_transfers;
  }
};

}  // namespace domain
}  // namespace settle
