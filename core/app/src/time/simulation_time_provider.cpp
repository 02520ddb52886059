#include "escrow/time/simulation_time_provider.hpp"

namespace escrow {

SimulationTimeProvider::SimulationTimeProvider(domain::TimestampMs start_ms)
    : current_time_ms_(start_ms) {}

domain::TimestampMs SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(domain::TimestampMs new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_by(): relative step; fetch_add keeps concurrent steps additive
// -----------------------------------------------------------------------------
domain::TimestampMs SimulationTimeProvider::advance_by(
    domain::TimestampMs delta_ms) {
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace escrow
