#pragma once

#include <atomic>
#include <cstdint>

namespace settle {

// -----------------------------------------------------------------------------
// SequenceGenerator: monotonic counter with restore support
// -----------------------------------------------------------------------------
//
// @brief  Hands out strictly increasing integers starting at a chosen first
//         value. Used for settlement ids (first = 1) and queue positions
//         (first = 0).
//
// @details
// Values are never reused within one generator. Across restarts the owner
// persists peek() and calls restore() with it before handing out new values,
// so ids and positions stay unique for the lifetime of the data set.
//
// Thread model:
//   next_id() is a relaxed fetch_add; uniqueness is the only ordering
//   requirement. Callers inside SettlementEngine already hold the engine
//   mutex, but the generator is safe on its own.
//
// Ownership:
//   Value member of SettlementRegistry / FairOrderingQueue. Non-copyable so
//   two owners can never issue the same value.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  explicit SequenceGenerator(std::uint64_t first = 0) : next_id_(first) {}

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // Returns the next value and advances the counter.
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // The value the next call to next_id() will return.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // restore(next)
  // -------------------------------------------------------------------------
  // @brief  Resets the counter so the next issued value is `next`.
  //
  // @details
  // Startup/rollback only: called while hydrating from a persisted snapshot.
  // Must not be called concurrently with next_id().
  // -------------------------------------------------------------------------
  void restore(std::uint64_t next) {
    next_id_.store(next, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace settle
