#pragma once

#include "settle/concurrent/sequence_generator.hpp"
#include "settle/domain/transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace settle {

// -----------------------------------------------------------------------------
// FairOrderingQueue
// -----------------------------------------------------------------------------
//
// @brief  FIFO of initiated settlements. Only the head may execute.
//
// @details
// enqueue() hands out positions from a persisted counter starting at 0, so
// positions strictly increase in initiation order and are never reissued.
// The queue holds exactly the head-eligible settlements (Initiated or
// Executing); the head is the one with the lowest position.
//
// A settlement leaves the queue through advance(), when it becomes
// Finalized, Failed or Disputed. A dispute resolved with Resume puts it back
// with reinstate() at its original position, which places it ahead of every
// settlement initiated after it.
//
// Thread model:
//   Not internally synchronized. Accessed only under the engine mutex.
// -----------------------------------------------------------------------------
class FairOrderingQueue {
 public:
  using Entry = std::pair<std::uint64_t, domain::SettlementId>;

  FairOrderingQueue() = default;

  FairOrderingQueue(const FairOrderingQueue&) = delete;
  FairOrderingQueue& operator=(const FairOrderingQueue&) = delete;

  // Assigns the next position to `id`. InvalidStateError if already queued.
  std::uint64_t enqueue(domain::SettlementId id);

  std::optional<domain::SettlementId> head() const;
  bool isHead(domain::SettlementId id) const;

  // Removes `id` from head eligibility. No-op if it is not queued.
  void advance(domain::SettlementId id);

  // -------------------------------------------------------------------------
  // reinstate(id, position)
  // -------------------------------------------------------------------------
  // Re-inserts `id` at a position it was issued earlier. InvalidStateError
  // if `id` is already queued, the position was never issued, or another
  // settlement currently holds it.
  // -------------------------------------------------------------------------
  void reinstate(domain::SettlementId id, std::uint64_t position);

  bool contains(domain::SettlementId id) const;
  std::optional<std::uint64_t> positionOf(domain::SettlementId id) const;

  // Number of head-eligible settlements.
  std::size_t length() const { return by_position_.size(); }

  // Position the next enqueue() will assign.
  std::uint64_t nextPosition() const { return positions_.peek(); }

  // Queued entries ordered by position.
  std::vector<Entry> entries() const;

  void restore(const std::vector<Entry>& entries, std::uint64_t next_position);

 private:
  SequenceGenerator positions_{0};
  std::map<std::uint64_t, domain::SettlementId> by_position_;
  std::unordered_map<domain::SettlementId, std::uint64_t> position_of_;
};

}  // namespace settle
