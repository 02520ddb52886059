#pragma once

#include "escrow/domain/types.hpp"

#include <map>

namespace escrow {

// -----------------------------------------------------------------------------
// FeeAccounting: per-asset creation fee liability
// -----------------------------------------------------------------------------
//
// @brief  Tracks, for each fee asset, how much collected creation fee is
//         still owed to future cleanup callers.
//
// @details
// accrue() runs when an order is created (with the measured fee delta) and
// release() when cleanup pays that order's fee out as a caller reward.
// release() is the only way a bucket shrinks and it refuses to go below zero:
// an insufficient bucket is an InvariantGuard error, because it means the
// ledger no longer matches the orders it is backing.
//
// There is one bucket per distinct fee asset. Amounts of different assets are
// never summed, so a fee configuration change between two orders cannot let
// liability in one asset mask a shortfall in another.
//
// Invariant: liability(asset) >= sum of fee.amount over live orders whose
// fee.asset == asset.
//
// Thread model:
//   Not synchronised. Owned by SwapEngine and only touched under its
//   CallGate.
// -----------------------------------------------------------------------------
class FeeAccounting {
 public:
  void accrue(const domain::AssetId& asset, domain::Amount amount);
  void release(const domain::AssetId& asset, domain::Amount amount);
  domain::Amount liability(const domain::AssetId& asset) const;

  // Every nonzero bucket, ordered by asset id.
  const std::map<domain::AssetId, domain::Amount>& buckets() const {
    return buckets_;
  }

  // Rollback hook: overwrite one bucket with a previously read value.
  void restoreBucket(const domain::AssetId& asset, domain::Amount amount);

 private:
  std::map<domain::AssetId, domain::Amount> buckets_;
};

}  // namespace escrow
