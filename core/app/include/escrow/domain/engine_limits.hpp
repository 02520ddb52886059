#pragma once

#include "escrow/domain/types.hpp"

#include <cstddef>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// EngineLimits: fixed timing windows and batch caps
// -----------------------------------------------------------------------------
//
// @brief  Parameters that stay constant for the lifetime of a SwapEngine.
//
// @details
// The values are copied into the engine at construction (from EngineConfig,
// which may load them from JSON). Nothing changes them afterwards, so every
// order created by one engine instance lives by the same windows.
//
// Windows:
//   An order is fillable while now <= created_at + order_expiry_ms.
//   It becomes eligible for cleanup once
//   now > created_at + order_expiry_ms + grace_period_ms.
//
// Batch caps bound the work a single call may do:
//   max_allowlist_batch     largest updateAllowlist() batch accepted.
//   default_withdraw_batch  cap used by the no-argument withdrawAllClaims().
// -----------------------------------------------------------------------------
struct EngineLimits {
  static constexpr TimestampMs kDayMs = 24LL * 60 * 60 * 1000;

  /// Lifetime of an order for filling purposes.
  TimestampMs order_expiry_ms{7 * kDayMs};

  /// Extra time after expiry before cleanup may delete the order.
  TimestampMs grace_period_ms{7 * kDayMs};

  /// Upper bound on entries in one allowlist update.
  std::size_t max_allowlist_batch{100};

  /// Number of claimable assets drained by withdrawAllClaims(caller).
  std::size_t default_withdraw_batch{50};
};

}  // namespace domain
}  // namespace escrow
