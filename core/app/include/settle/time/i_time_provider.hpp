#pragma once

#include <cstdint>

namespace settle {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for everything time-dependent in the settlement
//         core: creation timestamps, refund deadlines, price staleness.
//
// @details
// SettlementEngine never calls std::chrono directly. The daemon injects a
// LiveTimeProvider; tests inject a SimulationTimeProvider and move time
// forward explicitly, which makes timeout behaviour deterministic (a refund
// exactly at the deadline versus one millisecond after it).
//
// Units: int64_t milliseconds since the Unix epoch. The same unit is used in
// the JSON snapshot, IPC commands and price feed ticks.
//
// Thread-safety contract:
//   now_ms() may be called from any thread. Implementations that can be
//   written (SimulationTimeProvider) synchronize internally.
//
// Ownership:
//   Held by const reference. The provider must outlive its users.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in epoch milliseconds.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace settle
