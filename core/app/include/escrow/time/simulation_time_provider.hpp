#pragma once

#include "escrow/time/i_time_provider.hpp"

#include <atomic>

namespace escrow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set explicitly.
//
// @details
// Tests (and scripted demo runs) move time with advance_time() to an
// absolute instant or advance_by() by a delta, to step an order across its
// expiry and grace windows deterministically:
//
//   clock.advance_time(t0);                  // create at t0
//   clock.advance_by(limits.order_expiry_ms);  // still fillable (<=)
//   clock.advance_by(1);                     // expired
//
// Internal storage:
//   std::atomic<TimestampMs>, so the IPC thread and the test thread can read
//   it while another thread advances it.
//
// Thread model:
//   All members are safe from any thread. Monotonicity is not enforced;
//   tests may set any instant.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at `start_ms` (epoch 0 by default).
  explicit SimulationTimeProvider(domain::TimestampMs start_ms = 0);

  domain::TimestampMs now_ms() const override;

  // Sets the clock to an absolute instant.
  void advance_time(domain::TimestampMs new_time_ms);

  // Moves the clock by `delta_ms` and returns the new time.
  domain::TimestampMs advance_by(domain::TimestampMs delta_ms);

 private:
  std::atomic<domain::TimestampMs> current_time_ms_;
};

}  // namespace escrow
