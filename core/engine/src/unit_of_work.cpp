#include "escrow/engine/unit_of_work.hpp"

#include <utility>

namespace escrow {

UnitOfWork::UnitOfWork(EngineState& state, IAssetTransfer& assets)
    : state_(state), assets_(assets) {
  assets_.beginUnit();
}

UnitOfWork::~UnitOfWork() {
  if (!committed_) {
    rollback();
  }
}

// -----------------------------------------------------------------------------
// touch*(): first image wins
// -----------------------------------------------------------------------------
void UnitOfWork::touchOrder(domain::OrderId id) {
  if (orders_.count(id) == 0) {
    orders_.emplace(id, state_.orders.slot(id));
  }
}

void UnitOfWork::touchCounters() {
  if (!counters_.has_value()) {
    counters_ = state_.orders.counters();
  }
}

void UnitOfWork::touchAccount(const domain::PrincipalId& principal) {
  if (accounts_.count(principal) == 0) {
    accounts_.emplace(principal, state_.ledger.account(principal));
  }
}

void UnitOfWork::touchFeeBucket(const domain::AssetId& asset) {
  if (fee_buckets_.count(asset) == 0) {
    fee_buckets_.emplace(asset, state_.fees.liability(asset));
  }
}

void UnitOfWork::touchAdmin() {
  if (!admin_.has_value()) {
    admin_ = AdminImage{state_.allowlist, state_.fee_config, state_.disabled};
  }
}

void UnitOfWork::emit(Notification notification) {
  pending_.push_back(std::move(notification));
}

// -----------------------------------------------------------------------------
// commit(): keep everything
// -----------------------------------------------------------------------------
std::vector<Notification> UnitOfWork::commit() {
  assets_.commitUnit();
  committed_ = true;
  return std::move(pending_);
}

// -----------------------------------------------------------------------------
// rollback(): restore captured images, then revert the backend
// -----------------------------------------------------------------------------
void UnitOfWork::rollback() noexcept {
  for (auto& [id, image] : orders_) {
    state_.orders.restoreSlot(id, std::move(image));
  }
  if (counters_.has_value()) {
    state_.orders.restoreCounters(*counters_);
  }
  for (auto& [principal, image] : accounts_) {
    state_.ledger.restoreAccount(principal, std::move(image));
  }
  for (const auto& [asset, amount] : fee_buckets_) {
    state_.fees.restoreBucket(asset, amount);
  }
  if (admin_.has_value()) {
    state_.allowlist = std::move(admin_->allowlist);
    state_.fee_config = admin_->fee_config;
    state_.disabled = admin_->disabled;
  }
  pending_.clear();
  assets_.abortUnit();
}

}  // namespace escrow
