#include "escrow/ledger/fee_accounting.hpp"
#include "escrow/domain/checked_amount.hpp"
#include "escrow/domain/engine_error.hpp"

namespace escrow {

void FeeAccounting::accrue(const domain::AssetId& asset,
                           domain::Amount amount) {
  if (domain::isNull(asset)) {
    throw EngineError(ErrorKind::Validation, "Invalid fee asset");
  }
  if (amount == 0) {
    return;
  }
  domain::Amount& bucket = buckets_[asset];
  bucket = domain::checkedAdd(bucket, amount, "fee liability");
}

void FeeAccounting::release(const domain::AssetId& asset,
                            domain::Amount amount) {
  if (liability(asset) < amount) {
    throw EngineError(ErrorKind::InvariantGuard,
                      "Insufficient fee liability for " + asset);
  }
  if (amount == 0) {
    return;
  }
  auto it = buckets_.find(asset);
  it->second -= amount;
  if (it->second == 0) {
    buckets_.erase(it);
  }
}

domain::Amount FeeAccounting::liability(const domain::AssetId& asset) const {
  auto it = buckets_.find(asset);
  return it == buckets_.end() ? 0 : it->second;
}

void FeeAccounting::restoreBucket(const domain::AssetId& asset,
                                  domain::Amount amount) {
  if (amount == 0) {
    buckets_.erase(asset);
  } else {
    buckets_[asset] = amount;
  }
}

}  // namespace escrow
