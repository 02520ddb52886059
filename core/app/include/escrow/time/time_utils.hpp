#pragma once

#include "escrow/domain/types.hpp"
#include "escrow/events/notification_types.hpp"

#include <chrono>

namespace escrow {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Bridge between the engine's integer clock (domain::TimestampMs) and the
// chrono Timestamp carried by notifications. Stateless.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(domain::TimestampMs ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline domain::TimestampMs timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace escrow
