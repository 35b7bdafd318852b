#include "settle/engine/settlement_engine.hpp"

#include "settle/domain/checked_amount.hpp"
#include "settle/domain/errors.hpp"
#include "settle/events/event_types.hpp"
#include "settle/price/price_policy.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace settle {

using domain::Address;
using domain::Amount;
using domain::Contribution;
using domain::DisputeOutcome;
using domain::Settlement;
using domain::SettlementId;
using domain::SettlementState;
using domain::Transfer;

namespace {

std::string idText(SettlementId id) {
  return "Settlement " + std::to_string(id);
}

void requireNotTerminal(const Settlement& s) {
  if (domain::isTerminal(s.state)) {
    throw AlreadyTerminalError(idText(s.id) + " is " +
                               domain::settlementStateToString(s.state));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: seed or load state
// -----------------------------------------------------------------------------
SettlementEngine::SettlementEngine(domain::EscrowConfig config,
                                   const ITimeProvider& clock, EventBus& bus,
                                   const IPriceGuard* price_guard,
                                   ISettlementStore* store)
    : config_(std::move(config)),
      clock_(clock),
      bus_(bus),
      price_guard_(price_guard),
      store_(store),
      registry_(config_.max_transfers_per_settlement,
                config_.default_timeout_ms, config_.max_timeout_ms) {
  disputers_.insert(config_.authorized_disputers.begin(),
                    config_.authorized_disputers.end());

  if (store_ == nullptr) {
    return;
  }

  std::optional<EngineSnapshot> snapshot = store_->load();
  if (!snapshot.has_value()) {
    std::cout << "[SettlementEngine] no snapshot found, starting empty\n";
    return;
  }

  hydrate(*snapshot);
  std::cout << "[SettlementEngine] restored " << registry_.size()
            << " settlements, next id " << registry_.nextSettlementId()
            << ", queue length " << queue_.length()
            << (paused_ ? ", PAUSED" : "") << "\n";

  InvariantReport report = checkInvariantsLocked();
  for (const auto& violation : report.violations) {
    std::cerr << "[SettlementEngine] restored state violates invariant: "
              << violation << "\n";
  }
}

// -----------------------------------------------------------------------------
// transact(): one linearized, all-or-nothing operation
// -----------------------------------------------------------------------------
template <typename Fn>
auto SettlementEngine::transact(Fn&& fn) {
  using Result = std::invoke_result_t<Fn&>;

  std::vector<Event> committed;
  std::optional<std::conditional_t<std::is_void_v<Result>, bool, Result>>
      result;
  {
    std::lock_guard lock(mutex_);
    pending_events_.clear();
    const std::uint64_t sequence_before = next_event_sequence_;

    std::optional<EngineSnapshot> before;
    if (store_ != nullptr) {
      before = captureSnapshot();
    }

    try {
      if constexpr (std::is_void_v<Result>) {
        fn();
        result.emplace(true);
      } else {
        result.emplace(fn());
      }
      if (store_ != nullptr) {
        store_->save(captureSnapshot());
      }
    } catch (const SettlementError& e) {
      if (before.has_value()) {
        hydrate(*before);
      }
      next_event_sequence_ = sequence_before;
      pending_events_.clear();
      if (e.code() == ErrorCode::Storage) {
        std::cerr << "[SettlementEngine] commit failed, state rolled back: "
                  << e.what() << "\n";
      }
      throw;
    }

    committed.swap(pending_events_);
  }

  for (const auto& event : committed) {
    bus_.publish(event);
  }

  if constexpr (!std::is_void_v<Result>) {
    return std::move(*result);
  }
}

// Stamps the commit time and the next sequence id on an event.
void SettlementEngine::emit(Event event) {
  const std::int64_t now = clock_.now_ms();
  const std::uint64_t seq = next_event_sequence_++;
  std::visit(
      [now, seq](auto& e) {
        e.timestamp_ms = now;
        e.sequence_id = seq;
      },
      event);
  pending_events_.push_back(std::move(event));
}

// =============================================================================
// Settlement lifecycle
// =============================================================================

SettlementId SettlementEngine::create(const Address& caller,
                                      std::vector<Transfer> transfers,
                                      std::int64_t timeout_ms,
                                      bool requires_price) {
  return transact([&]() {
    requireCaller(caller);
    requireNotPaused("create");

    SettlementId id = registry_.create(caller, std::move(transfers), timeout_ms,
                                       clock_.now_ms(), requires_price);
    const Settlement& s = registry_.get(id);
    ledger_.open(id, s.total_amount);

    SettlementCreatedEvent ev;
    ev.settlement_id = id;
    ev.initiator = caller;
    ev.total_amount = s.total_amount;
    ev.total_transfers = s.total_transfers;
    ev.deadline_ms = s.deadline_ms();
    ev.requires_price = requires_price;
    emit(std::move(ev));

    std::cout << "[SettlementEngine] created " << id << " by " << caller
              << " (" << s.total_transfers << " transfers, total "
              << s.total_amount << ")\n";
    return id;
  });
}

Amount SettlementEngine::deposit(const Address& caller, SettlementId id,
                                 Amount amount) {
  return transact([&]() {
    requireCaller(caller);
    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    requireNotPaused("deposit");
    if (s.state != SettlementState::Pending) {
      throw InvalidStateError(idText(id) + " no longer accepts deposits (" +
                              domain::settlementStateToString(s.state) + ")");
    }
    if (amount == 0) {
      throw ValidationError("Deposit amount must be positive");
    }

    Amount total = ledger_.credit(id, caller, amount);
    s.total_deposited = total;

    DepositReceivedEvent ev;
    ev.settlement_id = id;
    ev.depositor = caller;
    ev.amount = amount;
    ev.total_deposited = total;
    emit(std::move(ev));
    return total;
  });
}

std::uint64_t SettlementEngine::initiate(const Address& caller,
                                         SettlementId id) {
  return transact([&]() {
    requireCaller(caller);
    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    requireNotPaused("initiate");
    if (caller != s.initiator) {
      throw UnauthorizedError("Only the initiator may initiate " + idText(id));
    }
    if (s.state != SettlementState::Pending) {
      throw InvalidStateError(idText(id) + " cannot be initiated from " +
                              domain::settlementStateToString(s.state));
    }
    if (ledger_.deposited(id) < s.total_amount) {
      throw NotFullyFundedError(
          idText(id) + " has " + std::to_string(ledger_.deposited(id)) +
          " of " + std::to_string(s.total_amount) + " deposited");
    }

    // Price check happens before the first write.
    std::optional<domain::Price> locked;
    if (s.requires_price) {
      locked = resolvePrice(s);
    }

    std::uint64_t position = queue_.enqueue(id);
    s.state = SettlementState::Initiated;
    s.queue_position = position;
    s.initiated_at_ms = clock_.now_ms();
    s.locked_price = locked;

    SettlementInitiatedEvent ev;
    ev.settlement_id = id;
    ev.queue_position = position;
    ev.price_locked = locked.has_value();
    ev.locked_price = locked.value_or(0);
    emit(std::move(ev));

    std::cout << "[SettlementEngine] initiated " << id << " at queue position "
              << position << "\n";
    return position;
  });
}

std::uint32_t SettlementEngine::execute(const Address& caller, SettlementId id,
                                        std::uint32_t count) {
  return transact([&]() {
    requireCaller(caller);
    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    requireNotPaused("execute");
    if (s.state == SettlementState::Pending ||
        s.state == SettlementState::Disputed) {
      throw InvalidStateError(idText(id) + " cannot execute while " +
                              domain::settlementStateToString(s.state));
    }
    if (!queue_.isHead(id)) {
      auto head = queue_.head();
      throw QueueOrderError(
          idText(id) + " is not at the head of the queue (head is " +
          (head ? std::to_string(*head) : std::string("empty")) + ")");
    }
    if (count == 0) {
      throw InvalidBatchError("Batch size must be positive");
    }

    const std::uint32_t n = std::min(count, s.remaining_transfers());
    std::vector<Transfer> batch = registry_.peekBatch(id, n);
    ledger_.checkRelease(id, batch);

    Amount released = 0;
    for (const auto& t : batch) {
      ledger_.release(id, t.to, t.amount);
      released += t.amount;  // bounded by checkRelease
    }
    const std::uint32_t first = registry_.markExecuted(id, n);
    if (s.state == SettlementState::Initiated) {
      s.state = SettlementState::Executing;
    }

    TransfersExecutedEvent executed;
    executed.settlement_id = id;
    executed.first_index = first;
    executed.count = n;
    executed.executed_transfers = s.executed_transfers;
    executed.total_transfers = s.total_transfers;
    executed.amount_released = released;
    emit(std::move(executed));

    if (s.remaining_transfers() == 0) {
      s.state = SettlementState::Finalized;
      s.finalized_at_ms = clock_.now_ms();
      queue_.advance(id);

      SettlementFinalizedEvent finalized;
      finalized.settlement_id = id;
      finalized.total_released = ledger_.released(id);
      emit(std::move(finalized));

      std::cout << "[SettlementEngine] finalized " << id << "\n";
    }
    return n;
  });
}

std::vector<Contribution> SettlementEngine::refund(const Address& caller,
                                                   SettlementId id) {
  return transact([&]() {
    requireCaller(caller);

    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    if (s.state != SettlementState::Pending &&
        s.state != SettlementState::Initiated) {
      throw InvalidStateError(idText(id) + " cannot be refunded while " +
                              domain::settlementStateToString(s.state));
    }
    if (caller != s.initiator && !ledger_.isDepositor(id, caller)) {
      throw UnauthorizedError("Only a depositor or the initiator may refund " +
                              idText(id));
    }
    const std::int64_t now = clock_.now_ms();
    if (now <= s.deadline_ms()) {
      throw TimeoutNotReachedError(idText(id) + " refundable after " +
                                   std::to_string(s.deadline_ms()) +
                                   " (now " + std::to_string(now) + ")");
    }

    std::vector<Contribution> refunds = ledger_.refundAll(id);
    queue_.advance(id);
    s.total_deposited = 0;
    s.state = SettlementState::Failed;

    Amount total = 0;
    for (const auto& r : refunds) {
      total += r.amount;
    }

    SettlementRefundedEvent ev;
    ev.settlement_id = id;
    ev.refunds = refunds;
    ev.total_refunded = total;
    ev.reason = "timeout";
    emit(std::move(ev));

    std::cout << "[SettlementEngine] refunded " << id << " after timeout ("
              << total << " to " << refunds.size() << " depositors)\n";
    return refunds;
  });
}

SettlementState SettlementEngine::dispute(const Address& caller,
                                          SettlementId id,
                                          const std::string& reason) {
  return transact([&]() {
    requireCaller(caller);
    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    requireNotPaused("dispute");
    if (s.state == SettlementState::Disputed) {
      throw InvalidStateError(idText(id) + " is already disputed");
    }
    if (caller != s.initiator && caller != config_.admin &&
        disputers_.count(caller) == 0) {
      throw UnauthorizedError(caller + " may not dispute " + idText(id));
    }
    if (reason.empty()) {
      throw ValidationError("A dispute needs a reason");
    }

    const SettlementState previous = s.state;
    s.state_before_dispute = previous;
    s.state = SettlementState::Disputed;
    s.dispute_reason = reason;
    s.disputed_by = caller;
    queue_.advance(id);

    SettlementDisputedEvent ev;
    ev.settlement_id = id;
    ev.disputed_by = caller;
    ev.reason = reason;
    ev.previous_state = previous;
    emit(std::move(ev));

    std::cout << "[SettlementEngine] " << id << " disputed by " << caller
              << ": " << reason << "\n";
    return previous;
  });
}

SettlementState SettlementEngine::resolveDispute(const Address& caller,
                                                 SettlementId id,
                                                 DisputeOutcome outcome) {
  return transact([&]() {
    requireCaller(caller);
    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    requireAdmin(caller);
    if (s.state != SettlementState::Disputed ||
        !s.state_before_dispute.has_value()) {
      throw InvalidStateError(idText(id) + " is not disputed");
    }

    if (outcome == DisputeOutcome::Resume) {
      const SettlementState restored = *s.state_before_dispute;
      if (domain::isQueued(restored)) {
        queue_.reinstate(id, s.queue_position.value());
      }
      s.state = restored;
    } else {
      std::vector<Contribution> refunds = ledger_.refundAll(id);
      s.total_deposited = 0;
      s.state = SettlementState::Failed;

      Amount total = 0;
      for (const auto& r : refunds) {
        total += r.amount;
      }
      SettlementRefundedEvent refunded;
      refunded.settlement_id = id;
      refunded.refunds = std::move(refunds);
      refunded.total_refunded = total;
      refunded.reason = "dispute: " + s.dispute_reason;
      emit(std::move(refunded));
    }
    s.state_before_dispute.reset();

    DisputeResolvedEvent ev;
    ev.settlement_id = id;
    ev.outcome = outcome;
    ev.resulting_state = s.state;
    emit(std::move(ev));

    std::cout << "[SettlementEngine] dispute on " << id << " resolved: "
              << domain::disputeOutcomeToString(outcome) << " -> "
              << domain::settlementStateToString(s.state) << "\n";
    return s.state;
  });
}

// =============================================================================
// Administration
// =============================================================================

bool SettlementEngine::pause(const Address& caller) {
  return transact([&]() {
    requireCaller(caller);
    requireAdmin(caller);
    if (paused_) {
      return false;
    }
    paused_ = true;

    PauseChangedEvent ev;
    ev.paused = true;
    ev.changed_by = caller;
    emit(std::move(ev));
    std::cout << "[SettlementEngine] PAUSED by " << caller << "\n";
    return true;
  });
}

bool SettlementEngine::unpause(const Address& caller) {
  return transact([&]() {
    requireCaller(caller);
    requireAdmin(caller);
    if (!paused_) {
      return false;
    }
    paused_ = false;

    PauseChangedEvent ev;
    ev.paused = false;
    ev.changed_by = caller;
    emit(std::move(ev));
    std::cout << "[SettlementEngine] unpaused by " << caller << "\n";
    return true;
  });
}

std::optional<domain::Price> SettlementEngine::setManualPrice(
    const Address& caller, SettlementId id, std::optional<domain::Price> price) {
  return transact([&]() {
    requireCaller(caller);
    Settlement& s = registry_.mutableGet(id);
    requireNotTerminal(s);
    requireAdmin(caller);
    if (!s.requires_price) {
      throw ValidationError(idText(id) + " is not price-denominated");
    }
    if (s.state != SettlementState::Pending) {
      throw InvalidStateError("Manual price can only be set before " +
                              idText(id) + " is initiated");
    }
    if (price.has_value()) {
      if (auto reason = checkPriceBounds(*price, config_)) {
        throw ValidationError(*reason);
      }
    }

    std::optional<domain::Price> previous = s.manual_price;
    s.manual_price = price;
    return previous;
  });
}

bool SettlementEngine::addDisputer(const Address& caller,
                                   const Address& disputer) {
  return transact([&]() {
    requireCaller(caller);
    requireAdmin(caller);
    if (disputer.empty()) {
      throw ValidationError("Disputer address must not be empty");
    }
    return disputers_.insert(disputer).second;
  });
}

bool SettlementEngine::removeDisputer(const Address& caller,
                                      const Address& disputer) {
  return transact([&]() {
    requireCaller(caller);
    requireAdmin(caller);
    return disputers_.erase(disputer) != 0;
  });
}

// =============================================================================
// Queries
// =============================================================================

Settlement SettlementEngine::getSettlement(SettlementId id) const {
  std::lock_guard lock(mutex_);
  return registry_.get(id);
}

std::vector<Transfer> SettlementEngine::getTransfers(SettlementId id) const {
  std::lock_guard lock(mutex_);
  return registry_.get(id).transfers;
}

SettlementDetails SettlementEngine::getSettlementDetails(
    SettlementId id) const {
  std::lock_guard lock(mutex_);
  SettlementDetails details;
  details.settlement = registry_.get(id);
  details.contributions = ledger_.contributions(id);
  details.escrow_balance = ledger_.escrowBalance(id);
  details.released = ledger_.released(id);
  details.is_queue_head = queue_.isHead(id);
  return details;
}

InitiateCheck SettlementEngine::canInitiate(SettlementId id) const {
  std::lock_guard lock(mutex_);
  if (!registry_.contains(id)) {
    return {false, "Settlement not found"};
  }
  const Settlement& s = registry_.get(id);
  if (s.state != SettlementState::Pending) {
    return {false, std::string("Settlement is ") +
                       domain::settlementStateToString(s.state)};
  }
  if (paused_) {
    return {false, "Contract paused"};
  }
  if (ledger_.deposited(id) < s.total_amount) {
    return {false, "Insufficient deposits"};
  }
  if (s.requires_price) {
    try {
      resolvePrice(s);
    } catch (const PriceGuardError& e) {
      return {false, e.what()};
    }
  }
  return {true, "Ready"};
}

bool SettlementEngine::isEligibleForRefund(SettlementId id) const {
  std::lock_guard lock(mutex_);
  if (!registry_.contains(id)) {
    return false;
  }
  const Settlement& s = registry_.get(id);
  if (s.state != SettlementState::Pending &&
      s.state != SettlementState::Initiated) {
    return false;
  }
  return clock_.now_ms() > s.deadline_ms();
}

std::optional<SettlementId> SettlementEngine::queueHead() const {
  std::lock_guard lock(mutex_);
  return queue_.head();
}

std::size_t SettlementEngine::queueLength() const {
  std::lock_guard lock(mutex_);
  return queue_.length();
}

SettlementId SettlementEngine::nextSettlementId() const {
  std::lock_guard lock(mutex_);
  return registry_.nextSettlementId();
}

Amount SettlementEngine::balanceOf(const Address& address) const {
  std::lock_guard lock(mutex_);
  return ledger_.balanceOf(address);
}

bool SettlementEngine::isPaused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

bool SettlementEngine::isDisputer(const Address& address) const {
  std::lock_guard lock(mutex_);
  return disputers_.count(address) != 0;
}

InvariantReport SettlementEngine::checkInvariants() const {
  std::lock_guard lock(mutex_);
  return checkInvariantsLocked();
}

// =============================================================================
// Private helpers
// =============================================================================

EngineSnapshot SettlementEngine::captureSnapshot() const {
  EngineSnapshot snapshot;
  snapshot.settlements.reserve(registry_.size());
  for (const auto& [id, s] : registry_.settlements()) {
    snapshot.settlements.push_back(s);
  }
  snapshot.next_settlement_id = registry_.nextSettlementId();
  snapshot.accounts = ledger_.accounts();
  snapshot.balances = ledger_.balances();
  snapshot.queue_entries = queue_.entries();
  snapshot.next_queue_position = queue_.nextPosition();
  snapshot.paused = paused_;
  snapshot.disputers = disputers_;
  snapshot.next_event_sequence = next_event_sequence_;
  return snapshot;
}

// The persisted disputer set replaces the one seeded from config.
void SettlementEngine::hydrate(const EngineSnapshot& snapshot) {
  registry_.restore(snapshot.settlements, snapshot.next_settlement_id);
  ledger_.restore(snapshot.accounts, snapshot.balances);
  queue_.restore(snapshot.queue_entries, snapshot.next_queue_position);
  paused_ = snapshot.paused;
  disputers_ = snapshot.disputers;
  next_event_sequence_ = snapshot.next_event_sequence;
}

// -----------------------------------------------------------------------------
// resolvePrice(): manual override, else one guard query plus policy
// -----------------------------------------------------------------------------
domain::Price SettlementEngine::resolvePrice(const Settlement& s) const {
  if (s.manual_price.has_value()) {
    if (auto reason = checkPriceBounds(*s.manual_price, config_)) {
      throw PriceGuardError(*reason);
    }
    return *s.manual_price;
  }

  if (price_guard_ == nullptr) {
    throw PriceGuardError("No price guard configured and no manual price set");
  }

  domain::SecuredPrice price;
  try {
    price = price_guard_->getSecuredPrice();
  } catch (const PriceGuardError&) {
    throw;
  } catch (const std::exception& e) {
    throw PriceGuardError(std::string("Price guard unavailable: ") + e.what());
  }

  if (auto reason = evaluatePrice(price, config_, clock_.now_ms())) {
    throw PriceGuardError(*reason);
  }
  return price.price;
}

// -----------------------------------------------------------------------------
// checkInvariantsLocked()
// -----------------------------------------------------------------------------
InvariantReport SettlementEngine::checkInvariantsLocked() const {
  InvariantReport report;
  auto fail = [&report](SettlementId id, const std::string& what) {
    report.holds = false;
    report.violations.push_back(idText(id) + ": " + what);
  };

  for (const auto& [id, s] : registry_.settlements()) {
    const bool active = s.state == SettlementState::Pending ||
                        domain::isQueued(s.state);

    if (active && s.total_deposited > s.total_amount) {
      fail(id, "deposits exceed total amount");
    }

    if (s.executed_transfers > s.total_transfers ||
        s.total_transfers != s.transfers.size()) {
      fail(id, "transfer counters out of range");
    } else {
      Amount executed_sum = 0;
      for (std::uint32_t i = 0; i < s.total_transfers; ++i) {
        const bool expected = i < s.executed_transfers;
        if (s.transfers[i].executed != expected) {
          fail(id, "executed flags are not a prefix of length " +
                       std::to_string(s.executed_transfers));
          break;
        }
        if (expected) {
          executed_sum += s.transfers[i].amount;
        }
      }
      if (ledger_.contains(id) && executed_sum != ledger_.released(id)) {
        fail(id, "executed amount differs from escrow releases");
      }
    }

    const bool complete = s.executed_transfers == s.total_transfers;
    if (s.state != SettlementState::Failed &&
        complete != (s.state == SettlementState::Finalized)) {
      fail(id, "finalized state does not match transfer completion");
    }

    if (!ledger_.contains(id)) {
      fail(id, "no escrow account");
    } else {
      const domain::EscrowAccount& acct = ledger_.account(id);
      if (acct.closed) {
        if (s.state != SettlementState::Failed || s.total_deposited != 0) {
          fail(id, "closed escrow account on a settlement that is not refunded");
        }
      } else {
        if (acct.released > acct.deposited) {
          fail(id, "released more than deposited");
        }
        if (acct.deposited != s.total_deposited) {
          fail(id, "escrow deposits differ from total_deposited");
        }
      }
    }

    const bool queued = queue_.contains(id);
    if (queued != domain::isQueued(s.state)) {
      fail(id, queued ? "queued while not head-eligible"
                      : "head-eligible but not queued");
    }
    if (queued && queue_.positionOf(id) != s.queue_position) {
      fail(id, "queue position mismatch");
    }
    if (s.queue_position.has_value() &&
        *s.queue_position >= queue_.nextPosition()) {
      fail(id, "queue position was never issued");
    }
  }
  return report;
}

void SettlementEngine::requireCaller(const Address& caller) const {
  if (caller.empty()) {
    throw ValidationError("Caller identity must not be empty");
  }
}

void SettlementEngine::requireAdmin(const Address& caller) const {
  if (caller != config_.admin) {
    throw UnauthorizedError(caller + " is not the admin");
  }
}

void SettlementEngine::requireNotPaused(const char* operation) const {
  if (paused_) {
    throw PausedError(std::string("Cannot ") + operation + " while paused");
  }
}

}  // namespace settle
