#pragma once

#include "settle/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace settle {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose value only changes when the owner sets it.
//
// @details
// Tests construct one with a fixed start time, create settlements, then call
// advance_by() to step across refund deadlines or price staleness windows.
// Time does not move on its own, so a test can land exactly on a deadline.
//
// Internal storage is a std::atomic<int64_t>: a test thread may advance the
// clock while engine calls on other threads read it.
//
// Monotonicity is not enforced; set_time() may move backwards, which some
// tests use to fabricate stale price ticks.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // set_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Jumps the clock to an absolute epoch-millisecond value.
  // -------------------------------------------------------------------------
  void set_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_ms and returns the new value.
  //
  // @details
  // fetch_add keeps concurrent advances from losing updates.
  // -------------------------------------------------------------------------
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace settle
