#pragma once

#include "escrow/time/i_time_provider.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock and converts to epoch milliseconds.
//
// @details
// Used by the escrow_engine_app executable. Order windows are then measured
// in real time: an order created now expires seven days from now with the
// default limits.
//
// Thread model:
//   Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  domain::TimestampMs now_ms() const override;
};

}  // namespace escrow
