#pragma once

#include "settle/domain/settlement.hpp"
#include "settle/domain/settlement_state.hpp"
#include "settle/domain/transfer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace settle {

// -----------------------------------------------------------------------------
// Settlement notifications
// -----------------------------------------------------------------------------
//
// One struct per kind of committed change. SettlementEngine collects them
// while an operation runs and publishes them on the EventBus only after the
// operation has fully succeeded (and, when a store is attached, after the
// snapshot has been written). A failed operation publishes nothing.
//
// Common trailer on every event:
//   timestamp_ms  engine clock at commit time
//   sequence_id   engine-wide notification counter, strictly increasing and
//                 persisted, so indexers can detect gaps across restarts.
// -----------------------------------------------------------------------------

struct SettlementCreatedEvent {
  domain::SettlementId settlement_id{0};
  domain::Address initiator;
  domain::Amount total_amount{0};
  std::uint32_t total_transfers{0};
  std::int64_t deadline_ms{0};
  bool requires_price{false};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct DepositReceivedEvent {
  domain::SettlementId settlement_id{0};
  domain::Address depositor;
  domain::Amount amount{0};
  domain::Amount total_deposited{0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct SettlementInitiatedEvent {
  domain::SettlementId settlement_id{0};
  std::uint64_t queue_position{0};
  bool price_locked{false};
  domain::Price locked_price{0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// One per successful execute() batch.
struct TransfersExecutedEvent {
  domain::SettlementId settlement_id{0};
  std::uint32_t first_index{0};   // Index of the first transfer in the batch
  std::uint32_t count{0};         // Transfers executed by this batch
  std::uint32_t executed_transfers{0};
  std::uint32_t total_transfers{0};
  domain::Amount amount_released{0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct SettlementFinalizedEvent {
  domain::SettlementId settlement_id{0};
  domain::Amount total_released{0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// Timeout refund or dispute force-fail. `refunds` lists what each depositor
// got back; it may be empty when nothing was deposited.
struct SettlementRefundedEvent {
  domain::SettlementId settlement_id{0};
  std::vector<domain::Contribution> refunds;
  domain::Amount total_refunded{0};
  std::string reason;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct SettlementDisputedEvent {
  domain::SettlementId settlement_id{0};
  domain::Address disputed_by;
  std::string reason;
  domain::SettlementState previous_state{domain::SettlementState::Pending};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct DisputeResolvedEvent {
  domain::SettlementId settlement_id{0};
  domain::DisputeOutcome outcome{domain::DisputeOutcome::Resume};
  domain::SettlementState resulting_state{domain::SettlementState::Pending};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct PauseChangedEvent {
  bool paused{false};
  domain::Address changed_by;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace settle
