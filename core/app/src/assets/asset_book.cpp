#include "escrow/assets/asset_book.hpp"

#include <limits>
#include <utility>

namespace escrow {

namespace {

constexpr std::uint32_t kBpsDenominator = 10000;

void addTo(domain::Amount& slot, domain::Amount amount) {
  if (amount > std::numeric_limits<domain::Amount>::max() - slot) {
    throw TransferError("balance overflow");
  }
  slot += amount;
}

}  // namespace

AssetBook::AssetBook(domain::PrincipalId operator_id)
    : operator_id_(std::move(operator_id)) {}

// -----------------------------------------------------------------------------
// Setup
// -----------------------------------------------------------------------------
void AssetBook::mint(const domain::AssetId& asset,
                     const domain::PrincipalId& owner, domain::Amount amount) {
  std::lock_guard lock(mutex_);
  addTo(balances_[{asset, owner}], amount);
}

void AssetBook::approve(const domain::AssetId& asset,
                        const domain::PrincipalId& owner,
                        const domain::PrincipalId& spender,
                        domain::Amount amount) {
  std::lock_guard lock(mutex_);
  allowances_[{asset, owner, spender}] = amount;
}

void AssetBook::setBehavior(const domain::AssetId& asset,
                            AssetBehavior behavior, std::uint32_t tax_bps) {
  if (tax_bps > kBpsDenominator) {
    throw std::invalid_argument("tax_bps above 10000");
  }
  std::lock_guard lock(mutex_);
  settings_[asset] = Settings{behavior, tax_bps};
}

void AssetBook::setTransferHook(TransferHook hook) {
  std::lock_guard lock(mutex_);
  hook_ = std::move(hook);
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
domain::Amount AssetBook::balanceOf(const domain::AssetId& asset,
                                    const domain::PrincipalId& owner) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find({asset, owner});
  return it == balances_.end() ? 0 : it->second;
}

domain::Amount AssetBook::allowance(const domain::AssetId& asset,
                                    const domain::PrincipalId& owner,
                                    const domain::PrincipalId& spender) const {
  std::lock_guard lock(mutex_);
  auto it = allowances_.find({asset, owner, spender});
  return it == allowances_.end() ? 0 : it->second;
}

// -----------------------------------------------------------------------------
// transferIn: pull against the operator's allowance
// -----------------------------------------------------------------------------
domain::Amount AssetBook::transferIn(const domain::AssetId& asset,
                                     const domain::PrincipalId& from,
                                     const domain::PrincipalId& to,
                                     domain::Amount amount) {
  invokeHook(asset);

  std::lock_guard lock(mutex_);
  const Settings settings = settingsFor(asset);
  if (settings.behavior == AssetBehavior::Paused) {
    throw TransferError("asset " + asset + " is paused");
  }
  if (settings.behavior == AssetBehavior::SilentNoop) {
    return amount;
  }
  if (settings.behavior == AssetBehavior::Refusing) {
    return 0;
  }

  domain::Amount& allowed = allowances_[{asset, from, operator_id_}];
  if (allowed < amount) {
    throw TransferError("insufficient allowance for " + asset);
  }
  const domain::Amount reported = move(asset, from, to, amount);
  allowed -= amount;
  return reported;
}

// -----------------------------------------------------------------------------
// transferOut: push from the holder
// -----------------------------------------------------------------------------
bool AssetBook::transferOut(const domain::AssetId& asset,
                            const domain::PrincipalId& from,
                            const domain::PrincipalId& to,
                            domain::Amount amount) {
  invokeHook(asset);

  std::lock_guard lock(mutex_);
  const Settings settings = settingsFor(asset);
  switch (settings.behavior) {
    case AssetBehavior::Paused:
      throw TransferError("asset " + asset + " is paused");
    case AssetBehavior::SilentNoop:
      return true;
    case AssetBehavior::Refusing:
      return false;
    case AssetBehavior::Standard:
    case AssetBehavior::Taxed:
      break;
  }
  move(asset, from, to, amount);
  return true;
}

domain::Amount AssetBook::move(const domain::AssetId& asset,
                               const domain::PrincipalId& from,
                               const domain::PrincipalId& to,
                               domain::Amount amount) {
  domain::Amount& source = balances_[{asset, from}];
  if (source < amount) {
    throw TransferError("insufficient balance of " + asset + " for " + from);
  }

  const Settings settings = settingsFor(asset);
  domain::Amount delivered = amount;
  if (settings.behavior == AssetBehavior::Taxed) {
    // Split so amount * tax_bps cannot overflow.
    const domain::Amount tax =
        amount / kBpsDenominator * settings.tax_bps +
        amount % kBpsDenominator * settings.tax_bps / kBpsDenominator;
    delivered = amount - tax;
  }

  source -= amount;
  try {
    addTo(balances_[{asset, to}], delivered);
  } catch (const TransferError&) {
    source += amount;
    throw;
  }
  return amount;
}

AssetBook::Settings AssetBook::settingsFor(const domain::AssetId& asset) const {
  auto it = settings_.find(asset);
  return it == settings_.end() ? Settings{} : it->second;
}

void AssetBook::invokeHook(const domain::AssetId& asset) {
  TransferHook hook;
  {
    std::lock_guard lock(mutex_);
    hook = hook_;
  }
  if (hook) {
    hook(asset);
  }
}

// -----------------------------------------------------------------------------
// Units
// -----------------------------------------------------------------------------
void AssetBook::beginUnit() {
  std::lock_guard lock(mutex_);
  units_.push_back(Snapshot{balances_, allowances_});
}

void AssetBook::commitUnit() {
  std::lock_guard lock(mutex_);
  if (units_.empty()) {
    throw std::logic_error("commitUnit without beginUnit");
  }
  units_.pop_back();
}

void AssetBook::abortUnit() noexcept {
  std::lock_guard lock(mutex_);
  if (units_.empty()) {
    return;
  }
  balances_ = std::move(units_.back().balances);
  allowances_ = std::move(units_.back().allowances);
  units_.pop_back();
}

std::size_t AssetBook::openUnits() const {
  std::lock_guard lock(mutex_);
  return units_.size();
}

}  // namespace escrow
