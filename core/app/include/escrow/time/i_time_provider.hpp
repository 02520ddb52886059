#pragma once

#include "escrow/domain/types.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// ITimeProvider: source of "now" for expiry and cleanup decisions
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual clock interface injected into SwapEngine.
//
// @details
// The engine never reads the system clock directly. Order creation stamps
// created_at_ms from now_ms(); fill compares now_ms() against the expiry
// window; cleanup compares it against expiry + grace. Injecting the clock
// lets tests jump a week ahead without waiting:
//
//   - LiveTimeProvider        std::chrono::system_clock.
//   - SimulationTimeProvider  value set by advance_time() / advance_by().
//
// Units: milliseconds since the Unix epoch, as domain::TimestampMs.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently from any thread.
//
// Ownership:
//   SwapEngine holds a const reference. The provider must outlive it.
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
  virtual domain::TimestampMs now_ms() const = 0;
};

}  // namespace escrow
