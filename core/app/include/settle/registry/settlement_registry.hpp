#pragma once

#include "settle/concurrent/sequence_generator.hpp"
#include "settle/domain/settlement.hpp"
#include "settle/domain/transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace settle {

// -----------------------------------------------------------------------------
// SettlementRegistry
// -----------------------------------------------------------------------------
//
// @brief  Owns every Settlement record and its transfers, assigns ids and
//         tracks batch progress.
//
// @details
// Ids come from a SequenceGenerator that starts at 1 and is persisted, so an
// id is never reused, not even across restarts. Records are never removed:
// terminal settlements stay for audit.
//
// The registry validates the shape of new settlements and the bounds of a
// batch; it does not know about roles, funding or queue order. Those are
// checked by SettlementEngine before it calls in here.
//
// Thread model:
//   Not internally synchronized. Accessed only under the engine mutex.
// -----------------------------------------------------------------------------
class SettlementRegistry {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  max_transfers       upper bound on transfers per settlement.
  // @param  default_timeout_ms  used when create() receives timeout 0.
  // @param  max_timeout_ms      largest accepted timeout.
  // -------------------------------------------------------------------------
  SettlementRegistry(std::size_t max_transfers, std::int64_t default_timeout_ms,
                     std::int64_t max_timeout_ms);

  SettlementRegistry(const SettlementRegistry&) = delete;
  SettlementRegistry& operator=(const SettlementRegistry&) = delete;

  // -------------------------------------------------------------------------
  // create(...)
  // -------------------------------------------------------------------------
  //
  // @brief  Validates and stores a new PENDING settlement. Returns its id.
  //
  // @throws ValidationError          empty initiator, no transfers, more than
  //                                  max_transfers, empty from/to, zero
  //                                  amount, negative or oversized timeout.
  // @throws ArithmeticOverflowError  the transfer amounts do not sum within
  //                                  the Amount range.
  //
  // @details
  // total_amount is the sum of the transfer amounts. Every transfer starts
  // unexecuted regardless of the `executed` flag passed in. An id is only
  // consumed once validation has passed.
  // -------------------------------------------------------------------------
  domain::SettlementId create(const domain::Address& initiator,
                              std::vector<domain::Transfer> transfers,
                              std::int64_t timeout_ms, std::int64_t now_ms,
                              bool requires_price);

  // NotFoundError for an unknown id.
  const domain::Settlement& get(domain::SettlementId id) const;
  domain::Settlement& mutableGet(domain::SettlementId id);

  bool contains(domain::SettlementId id) const;

  // -------------------------------------------------------------------------
  // peekBatch(id, count)
  // -------------------------------------------------------------------------
  // The next `count` unexecuted transfers in array order, without marking
  // them. Same bounds checks as markExecuted().
  // -------------------------------------------------------------------------
  std::vector<domain::Transfer> peekBatch(domain::SettlementId id,
                                          std::uint32_t count) const;

  // -------------------------------------------------------------------------
  // markExecuted(id, count)
  // -------------------------------------------------------------------------
  // Flags the next `count` transfers as executed and advances
  // executed_transfers. Returns the index of the first transfer flagged.
  // InvalidBatchError if count is 0 or exceeds the remaining transfers.
  // -------------------------------------------------------------------------
  std::uint32_t markExecuted(domain::SettlementId id, std::uint32_t count);

  // The id the next successful create() will assign.
  domain::SettlementId nextSettlementId() const { return ids_.peek(); }

  std::size_t size() const { return settlements_.size(); }

  const std::map<domain::SettlementId, domain::Settlement>& settlements() const {
    return settlements_;
  }

  // Replaces all records and the id counter (startup and rollback).
  void restore(std::vector<domain::Settlement> settlements,
               domain::SettlementId next_id);

 private:
  void checkBatch(const domain::Settlement& s, std::uint32_t count) const;

  std::size_t max_transfers_;
  std::int64_t default_timeout_ms_;
  std::int64_t max_timeout_ms_;

  SequenceGenerator ids_{1};
  std::map<domain::SettlementId, domain::Settlement> settlements_;
};

}  // namespace settle
