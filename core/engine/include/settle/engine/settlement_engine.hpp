#pragma once

#include "settle/domain/escrow_config.hpp"
#include "settle/domain/settlement.hpp"
#include "settle/domain/transfer.hpp"
#include "settle/eventbus/event_bus.hpp"
#include "settle/events/event.hpp"
#include "settle/ledger/fund_ledger.hpp"
#include "settle/persistence/engine_snapshot.hpp"
#include "settle/persistence/i_settlement_store.hpp"
#include "settle/price/i_price_guard.hpp"
#include "settle/queue/fair_ordering_queue.hpp"
#include "settle/registry/settlement_registry.hpp"
#include "settle/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace settle {

// Settlement plus its escrow view, for get_details.
struct SettlementDetails {
  domain::Settlement settlement;
  std::vector<domain::Contribution> contributions;
  domain::Amount escrow_balance{0};
  domain::Amount released{0};
  bool is_queue_head{false};
};

// Answer of canInitiate(): ok == true iff initiate() by the initiator would
// currently succeed. `reason` is "Ready" or the first blocking condition.
struct InitiateCheck {
  bool ok{false};
  std::string reason;
};

struct InvariantReport {
  bool holds{true};
  std::vector<std::string> violations;
};

// -----------------------------------------------------------------------------
// SettlementEngine
// -----------------------------------------------------------------------------
//
// @brief  The settlement state machine. Every mutation of settlements,
//         escrow accounts and the queue goes through this class.
//
// @details
// Each public mutating method is one atomic operation:
//   1. Lock mutex_ (operations are fully linearized).
//   2. Check the caller's capability and every precondition.
//   3. Apply the change to registry_, ledger_ and queue_, collecting
//      notifications in pending_events_.
//   4. If a store is attached, write the new snapshot. On StorageError the
//      in-memory state is rolled back to the pre-operation snapshot and the
//      error is rethrown.
//   5. Unlock, then publish the collected notifications on the EventBus.
// A thrown SettlementError therefore means nothing changed and nothing was
// published.
//
// Capabilities:
//   create                  any caller (not while paused)
//   deposit                 any caller (the caller is the depositor)
//   initiate                the settlement's initiator
//   execute                 any caller, but only for the queue head
//   refund                  a depositor or the initiator, after the deadline
//   dispute                 the initiator, an authorized disputer or admin
//   resolveDispute, pause, unpause, setManualPrice,
//   addDisputer, removeDisputer            admin only
// While paused, create/deposit/initiate/execute/dispute fail with
// PausedError. Refund and admin operations stay available.
//
// Thread model:
//   All public methods are safe to call concurrently. EventBus callbacks run
//   on the calling thread after mutex_ is released and may call back into
//   the engine. Notifications from concurrent callers may interleave;
//   sequence_id gives the commit order.
//
// Ownership:
//   Owns the registry, ledger and queue. Holds non-owning references to the
//   clock, bus, price guard and store, which must outlive the engine.
// -----------------------------------------------------------------------------
class SettlementEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config       roles, limits and price thresholds.
  // @param  clock        time source for deadlines and price staleness.
  // @param  bus          destination of committed notifications.
  // @param  price_guard  consulted by initiate() for price-denominated
  //                      settlements. May be null; such settlements then
  //                      need an admin manual price.
  // @param  store        durable snapshot store. May be null (in-memory
  //                      engine). When set, the last committed snapshot is
  //                      loaded here; StorageError if it cannot be read.
  // -------------------------------------------------------------------------
  SettlementEngine(domain::EscrowConfig config, const ITimeProvider& clock,
                   EventBus& bus, const IPriceGuard* price_guard = nullptr,
                   ISettlementStore* store = nullptr);

  SettlementEngine(const SettlementEngine&) = delete;
  SettlementEngine& operator=(const SettlementEngine&) = delete;
  SettlementEngine(SettlementEngine&&) = delete;
  SettlementEngine& operator=(SettlementEngine&&) = delete;

  // =========================================================================
  // Settlement lifecycle
  // =========================================================================

  // -------------------------------------------------------------------------
  // create(caller, transfers, timeout_ms, requires_price)
  // -------------------------------------------------------------------------
  // Registers a PENDING settlement initiated by `caller` and opens its
  // escrow account. timeout_ms == 0 selects config.default_timeout_ms.
  // Returns the new id.
  // -------------------------------------------------------------------------
  domain::SettlementId create(const domain::Address& caller,
                              std::vector<domain::Transfer> transfers,
                              std::int64_t timeout_ms = 0,
                              bool requires_price = false);

  // -------------------------------------------------------------------------
  // deposit(caller, id, amount)
  // -------------------------------------------------------------------------
  // Adds `amount` from `caller` to the escrow of a PENDING settlement.
  // Returns the new total_deposited.
  // -------------------------------------------------------------------------
  domain::Amount deposit(const domain::Address& caller, domain::SettlementId id,
                         domain::Amount amount);

  // -------------------------------------------------------------------------
  // initiate(caller, id)
  // -------------------------------------------------------------------------
  //
  // @brief  PENDING -> INITIATED. Returns the assigned queue position.
  //
  // @throws UnauthorizedError    caller is not the initiator.
  // @throws NotFullyFundedError  deposits below total_amount.
  // @throws PriceGuardError      price-denominated settlement and no
  //                              acceptable price (see price_policy.hpp).
  //
  // @details
  // For a price-denominated settlement the admin manual price is used when
  // set; otherwise the price guard is queried once. The accepted price is
  // recorded as locked_price.
  // -------------------------------------------------------------------------
  std::uint64_t initiate(const domain::Address& caller, domain::SettlementId id);

  // -------------------------------------------------------------------------
  // execute(caller, id, count)
  // -------------------------------------------------------------------------
  //
  // @brief  Pays out the next min(count, remaining) transfers of the queue
  //         head, in array order. Returns the number executed.
  //
  // @throws QueueOrderError    id is not the current queue head.
  // @throws InvalidBatchError  count == 0.
  // @throws InvalidStateError  settlement is PENDING or DISPUTED.
  //
  // @details
  // The whole batch is checked against the escrow balance before the first
  // payout. The first batch moves INITIATED -> EXECUTING; the batch that
  // executes the last transfer moves it to FINALIZED and frees the head.
  // -------------------------------------------------------------------------
  std::uint32_t execute(const domain::Address& caller, domain::SettlementId id,
                        std::uint32_t count);

  // -------------------------------------------------------------------------
  // refund(caller, id)
  // -------------------------------------------------------------------------
  // PENDING/INITIATED -> FAILED once now > deadline. Every depositor gets
  // their contribution back; returns what was paid, per depositor.
  // -------------------------------------------------------------------------
  std::vector<domain::Contribution> refund(const domain::Address& caller,
                                           domain::SettlementId id);

  // -------------------------------------------------------------------------
  // dispute(caller, id, reason)
  // -------------------------------------------------------------------------
  // PENDING/INITIATED/EXECUTING -> DISPUTED. Halts execute and refund until
  // resolveDispute(). Returns the state the settlement was in.
  // -------------------------------------------------------------------------
  domain::SettlementState dispute(const domain::Address& caller,
                                  domain::SettlementId id,
                                  const std::string& reason);

  // -------------------------------------------------------------------------
  // resolveDispute(caller, id, outcome)
  // -------------------------------------------------------------------------
  // Admin only. Resume returns to the pre-dispute state (a queued settlement
  // regains its original queue position); ForceFail refunds the unreleased
  // escrow to the depositors and moves to FAILED. Returns the new state.
  // -------------------------------------------------------------------------
  domain::SettlementState resolveDispute(const domain::Address& caller,
                                         domain::SettlementId id,
                                         domain::DisputeOutcome outcome);

  // =========================================================================
  // Administration
  // =========================================================================

  // Return true when the flag actually changed.
  bool pause(const domain::Address& caller);
  bool unpause(const domain::Address& caller);

  // Sets (or with std::nullopt clears) the manual price of a PENDING
  // settlement. Returns the previous manual price.
  std::optional<domain::Price> setManualPrice(const domain::Address& caller,
                                              domain::SettlementId id,
                                              std::optional<domain::Price> price);

  // Return true when the disputer set changed.
  bool addDisputer(const domain::Address& caller,
                   const domain::Address& disputer);
  bool removeDisputer(const domain::Address& caller,
                      const domain::Address& disputer);

  // =========================================================================
  // Queries (snapshots; never mutate)
  // =========================================================================
  domain::Settlement getSettlement(domain::SettlementId id) const;
  std::vector<domain::Transfer> getTransfers(domain::SettlementId id) const;
  SettlementDetails getSettlementDetails(domain::SettlementId id) const;
  InitiateCheck canInitiate(domain::SettlementId id) const;
  bool isEligibleForRefund(domain::SettlementId id) const;
  std::optional<domain::SettlementId> queueHead() const;
  std::size_t queueLength() const;
  domain::SettlementId nextSettlementId() const;
  domain::Amount balanceOf(const domain::Address& address) const;
  bool isPaused() const;
  bool isDisputer(const domain::Address& address) const;

  // -------------------------------------------------------------------------
  // checkInvariants()
  // -------------------------------------------------------------------------
  // Audits every settlement against its escrow account and the queue and
  // lists each violated invariant. An empty list means the state is
  // consistent.
  // -------------------------------------------------------------------------
  InvariantReport checkInvariants() const;

  const domain::EscrowConfig& config() const { return config_; }

 private:
  template <typename Fn>
  auto transact(Fn&& fn);

  void emit(Event event);

  EngineSnapshot captureSnapshot() const;
  void hydrate(const EngineSnapshot& snapshot);

  domain::Price resolvePrice(const domain::Settlement& s) const;
  InvariantReport checkInvariantsLocked() const;

  void requireCaller(const domain::Address& caller) const;
  void requireAdmin(const domain::Address& caller) const;
  void requireNotPaused(const char* operation) const;

  domain::EscrowConfig config_;
  const ITimeProvider& clock_;
  EventBus& bus_;
  const IPriceGuard* price_guard_;
  ISettlementStore* store_;

  mutable std::mutex mutex_;

  SettlementRegistry registry_;
  FundLedger ledger_;
  FairOrderingQueue queue_;

  bool paused_{false};
  std::set<domain::Address> disputers_;
  std::uint64_t next_event_sequence_{1};

  std::vector<Event> pending_events_;
};

}  // namespace settle
