#pragma once

#include "settle/time/i_time_provider.hpp"

namespace settle {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall clock
// -----------------------------------------------------------------------------
// Reads std::chrono::system_clock. Used by the settlement_escrowd daemon.
// Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace settle
