#include "settle/time/simulation_time_provider.hpp"

namespace settle {

// -----------------------------------------------------------------------------
// now_ms(): atomic read
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// set_time(): atomic overwrite
// -----------------------------------------------------------------------------
void SimulationTimeProvider::set_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_by(): atomic increment, returns the post-increment value
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace settle
