#pragma once

#include "escrow/containers/enumerable_set.hpp"
#include "escrow/domain/types.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// AllowlistRegistry: set of assets eligible for new orders
// -----------------------------------------------------------------------------
//
// @brief  Membership test and stable enumeration of tradeable assets.
//
// @details
// Backed by an EnumerableSet, so isAllowed() is O(1) and removal keeps the
// list compact via swap-and-pop. Enumeration order is implementation-defined
// and stable between mutations.
//
// The registry only gates order creation. It has no say over withdrawals: an
// asset removed from the allowlist stays withdrawable from the claimable
// ledger.
//
// Construction:
//   - An empty initial list is rejected (Validation).
//   - A null asset id is rejected (Validation).
//   - Duplicate ids are de-duplicated silently.
//
// Thread model:
//   Not synchronised. Owned by SwapEngine and only touched under its
//   CallGate.
// -----------------------------------------------------------------------------
class AllowlistRegistry {
 public:
  // One applied membership change: (asset, now_allowed).
  using Change = std::pair<domain::AssetId, bool>;

  explicit AllowlistRegistry(const std::vector<domain::AssetId>& initial);

  bool isAllowed(const domain::AssetId& asset) const;
  const std::vector<domain::AssetId>& list() const;
  std::size_t count() const;

  // Single-entry mutators. Return true if membership changed; adding a
  // present asset or removing an absent one is a no-op returning false.
  // A null asset id is rejected.
  bool add(const domain::AssetId& asset);
  bool remove(const domain::AssetId& asset);

  // -------------------------------------------------------------------------
  // update(assets, allowed, max_batch)
  // -------------------------------------------------------------------------
  //
  // @brief  Applies a batch of membership changes.
  //
  // @param  assets     Asset ids to change.
  // @param  allowed    Parallel flags: true adds, false removes.
  // @param  max_batch  Largest batch accepted.
  //
  // @return The entries whose membership actually changed, in batch order.
  //
  // @details
  // The whole batch is validated before the first entry is applied: an empty
  // batch, mismatched lengths, a batch above max_batch or any null id throws
  // a Validation EngineError and leaves the registry untouched.
  // -------------------------------------------------------------------------
  std::vector<Change> update(const std::vector<domain::AssetId>& assets,
                             const std::vector<bool>& allowed,
                             std::size_t max_batch);

 private:
  EnumerableSet<domain::AssetId> assets_;
};

}  // namespace escrow
