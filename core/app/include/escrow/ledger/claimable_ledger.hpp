#pragma once

#include "escrow/containers/enumerable_set.hpp"
#include "escrow/domain/types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// CreditReason: why a principal was credited
// -----------------------------------------------------------------------------
enum class CreditReason {
  OrderCanceled,  // Maker canceled; escrowed sell amount returned
  OrderExpired,   // Cleanup swept an unfilled order; escrow returned
  CleanupReward,  // Cleanup caller paid the order's creation fee
};

inline const char* creditReasonToString(CreditReason reason) {
  switch (reason) {
    case CreditReason::OrderCanceled: return "order_canceled";
    case CreditReason::OrderExpired:  return "order_expired";
    case CreditReason::CleanupReward: return "cleanup_reward";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// ClaimableLedger: value owed to principals, settled by explicit withdrawal
// -----------------------------------------------------------------------------
//
// @brief  Per-(principal, asset) owed balance with an enumerable list of the
//         assets each principal can withdraw.
//
// @details
// Cancel and cleanup never move value; they credit this ledger. Withdrawal is
// the only path by which value leaves custody after order creation, and it is
// driven by SwapEngine, which debits here before calling the asset backend.
//
// Per principal the ledger keeps an Account:
//
//   balances  asset -> owed amount (only nonzero entries are kept)
//   assets    EnumerableSet of the assets with a nonzero balance
//
// Invariant: an asset is in `assets` iff its balance is nonzero. credit()
// inserts on the first credit of a pair, debit() removes when the balance
// reaches zero. dropStale() repairs an entry that violates the invariant
// (listed with a zero balance) and is only used by the batch withdrawal path.
//
// Rollback:
//   account() returns a copy of one principal's Account and restoreAccount()
//   puts such a copy back. UnitOfWork uses these to undo a failed call.
//
// Thread model:
//   Not synchronised. Owned by SwapEngine and only touched under its
//   CallGate.
// -----------------------------------------------------------------------------
class ClaimableLedger {
 public:
  struct Account {
    std::unordered_map<domain::AssetId, domain::Amount> balances;
    EnumerableSet<domain::AssetId> assets;
  };

  // -------------------------------------------------------------------------
  // credit(principal, asset, amount)
  // -------------------------------------------------------------------------
  //
  // @return false if amount is zero (no-op), true if the balance grew.
  //
  // @details
  // Throws Validation if amount > 0 and principal or asset is null, and
  // InvariantGuard if the balance would overflow. Credits always add; an
  // existing balance is never overwritten.
  // -------------------------------------------------------------------------
  bool credit(const domain::PrincipalId& principal,
              const domain::AssetId& asset, domain::Amount amount);

  // -------------------------------------------------------------------------
  // debit(principal, asset, amount)
  // -------------------------------------------------------------------------
  //
  // @details
  // Requires 0 < amount <= claimable(principal, asset); throws Validation
  // otherwise. Removes the asset from the principal's list when the balance
  // reaches zero.
  // -------------------------------------------------------------------------
  void debit(const domain::PrincipalId& principal,
             const domain::AssetId& asset, domain::Amount amount);

  domain::Amount claimable(const domain::PrincipalId& principal,
                           const domain::AssetId& asset) const;

  std::vector<domain::AssetId> claimableAssets(
      const domain::PrincipalId& principal) const;

  bool hasClaimableAsset(const domain::PrincipalId& principal,
                         const domain::AssetId& asset) const;

  // Last entry of the principal's asset list, or nullopt if the list is
  // empty. withdrawAllClaims() walks the list from the back so that each
  // removal is a pop.
  std::optional<domain::AssetId> lastAsset(
      const domain::PrincipalId& principal) const;

  // Removes a listed asset whose balance is zero. No-op otherwise.
  void dropStale(const domain::PrincipalId& principal,
                 const domain::AssetId& asset);

  // Sum of every principal's claimable balance of one asset.
  domain::Amount totalClaimable(const domain::AssetId& asset) const;

  // --- Rollback hooks -------------------------------------------------------
  std::optional<Account> account(const domain::PrincipalId& principal) const;
  void restoreAccount(const domain::PrincipalId& principal,
                      std::optional<Account> image);

 private:
  std::unordered_map<domain::PrincipalId, Account> accounts_;
};

}  // namespace escrow
