#include "escrow/ledger/claimable_ledger.hpp"
#include "escrow/domain/checked_amount.hpp"
#include "escrow/domain/engine_error.hpp"

#include <utility>

namespace escrow {

// -----------------------------------------------------------------------------
// credit: monotonic increment, list insert on first credit
// -----------------------------------------------------------------------------
bool ClaimableLedger::credit(const domain::PrincipalId& principal,
                             const domain::AssetId& asset,
                             domain::Amount amount) {
  if (amount == 0) {
    return false;
  }
  if (domain::isNull(principal)) {
    throw EngineError(ErrorKind::Validation, "Invalid claim principal");
  }
  if (domain::isNull(asset)) {
    throw EngineError(ErrorKind::Validation, "Invalid claim asset");
  }

  Account& acct = accounts_[principal];
  domain::Amount& balance = acct.balances[asset];
  balance = domain::checkedAdd(balance, amount, "claimable balance");
  acct.assets.insert(asset);
  return true;
}

// -----------------------------------------------------------------------------
// debit: bounded decrement, list removal at zero
// -----------------------------------------------------------------------------
void ClaimableLedger::debit(const domain::PrincipalId& principal,
                            const domain::AssetId& asset,
                            domain::Amount amount) {
  if (amount == 0) {
    throw EngineError(ErrorKind::Validation, "Invalid amount");
  }
  if (amount > claimable(principal, asset)) {
    throw EngineError(ErrorKind::Validation, "Insufficient claimable balance");
  }

  Account& acct = accounts_.at(principal);
  auto it = acct.balances.find(asset);
  it->second -= amount;
  if (it->second == 0) {
    acct.balances.erase(it);
    acct.assets.erase(asset);
  }
  if (acct.assets.empty() && acct.balances.empty()) {
    accounts_.erase(principal);
  }
}

domain::Amount ClaimableLedger::claimable(const domain::PrincipalId& principal,
                                          const domain::AssetId& asset) const {
  auto acct = accounts_.find(principal);
  if (acct == accounts_.end()) {
    return 0;
  }
  auto it = acct->second.balances.find(asset);
  return it == acct->second.balances.end() ? 0 : it->second;
}

std::vector<domain::AssetId> ClaimableLedger::claimableAssets(
    const domain::PrincipalId& principal) const {
  auto acct = accounts_.find(principal);
  if (acct == accounts_.end()) {
    return {};
  }
  return acct->second.assets.values();
}

bool ClaimableLedger::hasClaimableAsset(const domain::PrincipalId& principal,
                                        const domain::AssetId& asset) const {
  auto acct = accounts_.find(principal);
  return acct != accounts_.end() && acct->second.assets.contains(asset);
}

std::optional<domain::AssetId> ClaimableLedger::lastAsset(
    const domain::PrincipalId& principal) const {
  auto acct = accounts_.find(principal);
  if (acct == accounts_.end() || acct->second.assets.empty()) {
    return std::nullopt;
  }
  return acct->second.assets.back();
}

void ClaimableLedger::dropStale(const domain::PrincipalId& principal,
                                const domain::AssetId& asset) {
  auto acct = accounts_.find(principal);
  if (acct == accounts_.end() || claimable(principal, asset) != 0) {
    return;
  }
  acct->second.balances.erase(asset);
  acct->second.assets.erase(asset);
  if (acct->second.assets.empty() && acct->second.balances.empty()) {
    accounts_.erase(acct);
  }
}

domain::Amount ClaimableLedger::totalClaimable(
    const domain::AssetId& asset) const {
  domain::Amount total = 0;
  for (const auto& [principal, acct] : accounts_) {
    auto it = acct.balances.find(asset);
    if (it != acct.balances.end()) {
      total = domain::checkedAdd(total, it->second, "claimable total");
    }
  }
  return total;
}

// -----------------------------------------------------------------------------
// Rollback hooks
// -----------------------------------------------------------------------------
std::optional<ClaimableLedger::Account> ClaimableLedger::account(
    const domain::PrincipalId& principal) const {
  auto acct = accounts_.find(principal);
  if (acct == accounts_.end()) {
    return std::nullopt;
  }
  return acct->second;
}

void ClaimableLedger::restoreAccount(const domain::PrincipalId& principal,
                                     std::optional<Account> image) {
  if (image.has_value()) {
    accounts_[principal] = std::move(*image);
  } else {
    accounts_.erase(principal);
  }
}

}  // namespace escrow
