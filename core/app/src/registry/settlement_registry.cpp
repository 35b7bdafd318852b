#include "settle/registry/settlement_registry.hpp"

#include "settle/domain/checked_amount.hpp"
#include "settle/domain/errors.hpp"

#include <string>
#include <utility>

namespace settle {

using domain::Settlement;
using domain::SettlementId;
using domain::Transfer;

SettlementRegistry::SettlementRegistry(std::size_t max_transfers,
                                       std::int64_t default_timeout_ms,
                                       std::int64_t max_timeout_ms)
    : max_transfers_(max_transfers),
      default_timeout_ms_(default_timeout_ms),
      max_timeout_ms_(max_timeout_ms) {}

// -----------------------------------------------------------------------------
// create(): validate, sum, assign id
// -----------------------------------------------------------------------------
SettlementId SettlementRegistry::create(const domain::Address& initiator,
                                        std::vector<Transfer> transfers,
                                        std::int64_t timeout_ms,
                                        std::int64_t now_ms,
                                        bool requires_price) {
  if (initiator.empty()) {
    throw ValidationError("Initiator must not be empty");
  }
  if (transfers.empty()) {
    throw ValidationError("A settlement needs at least one transfer");
  }
  if (transfers.size() > max_transfers_) {
    throw ValidationError("Too many transfers: " +
                          std::to_string(transfers.size()) + " (max " +
                          std::to_string(max_transfers_) + ")");
  }
  if (timeout_ms < 0) {
    throw ValidationError("Timeout must not be negative");
  }
  if (timeout_ms == 0) {
    timeout_ms = default_timeout_ms_;
  }
  if (timeout_ms > max_timeout_ms_) {
    throw ValidationError("Timeout " + std::to_string(timeout_ms) +
                          " ms exceeds the maximum of " +
                          std::to_string(max_timeout_ms_) + " ms");
  }

  domain::Amount total = 0;
  for (std::size_t i = 0; i < transfers.size(); ++i) {
    Transfer& t = transfers[i];
    const std::string where = "Transfer " + std::to_string(i);
    if (t.from.empty() || t.to.empty()) {
      throw ValidationError(where + ": from and to must not be empty");
    }
    if (t.amount == 0) {
      throw ValidationError(where + ": amount must be positive");
    }
    total = domain::checkedAdd(total, t.amount, "settlement total");
    t.executed = false;
  }

  Settlement s;
  s.id = ids_.next_id();
  s.initiator = initiator;
  s.total_amount = total;
  s.state = domain::SettlementState::Pending;
  s.created_at_ms = now_ms;
  s.timeout_ms = timeout_ms;
  s.total_transfers = static_cast<std::uint32_t>(transfers.size());
  s.requires_price = requires_price;
  s.transfers = std::move(transfers);

  SettlementId id = s.id;
  settlements_.emplace(id, std::move(s));
  return id;
}

const Settlement& SettlementRegistry::get(SettlementId id) const {
  auto it = settlements_.find(id);
  if (it == settlements_.end()) {
    throw NotFoundError("Settlement " + std::to_string(id) + " not found");
  }
  return it->second;
}

Settlement& SettlementRegistry::mutableGet(SettlementId id) {
  auto it = settlements_.find(id);
  if (it == settlements_.end()) {
    throw NotFoundError("Settlement " + std::to_string(id) + " not found");
  }
  return it->second;
}

bool SettlementRegistry::contains(SettlementId id) const {
  return settlements_.count(id) != 0;
}

std::vector<Transfer> SettlementRegistry::peekBatch(SettlementId id,
                                                    std::uint32_t count) const {
  const Settlement& s = get(id);
  checkBatch(s, count);
  auto first = s.transfers.begin() + s.executed_transfers;
  return std::vector<Transfer>(first, first + count);
}

// -----------------------------------------------------------------------------
// markExecuted(): transfers are always consumed in array order
// -----------------------------------------------------------------------------
std::uint32_t SettlementRegistry::markExecuted(SettlementId id,
                                               std::uint32_t count) {
  Settlement& s = mutableGet(id);
  checkBatch(s, count);

  std::uint32_t first = s.executed_transfers;
  for (std::uint32_t i = first; i < first + count; ++i) {
    s.transfers[i].executed = true;
  }
  s.executed_transfers += count;
  return first;
}

void SettlementRegistry::restore(std::vector<Settlement> settlements,
                                 SettlementId next_id) {
  settlements_.clear();
  for (auto& s : settlements) {
    SettlementId id = s.id;
    settlements_.emplace(id, std::move(s));
  }
  ids_.restore(next_id);
}

void SettlementRegistry::checkBatch(const Settlement& s,
                                    std::uint32_t count) const {
  if (count == 0) {
    throw InvalidBatchError("Batch size must be positive");
  }
  if (count > s.remaining_transfers()) {
    throw InvalidBatchError("Batch of " + std::to_string(count) +
                            " exceeds the " +
                            std::to_string(s.remaining_transfers()) +
                            " remaining transfers of settlement " +
                            std::to_string(s.id));
  }
}

}  // namespace settle
