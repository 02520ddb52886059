#pragma once

#include "escrow/assets/i_asset_transfer.hpp"
#include "escrow/engine/engine_state.hpp"
#include "escrow/events/notification.hpp"

#include <map>
#include <optional>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// UnitOfWork: all-or-nothing boundary of one engine call
// -----------------------------------------------------------------------------
//
// @brief  Records the first image of every entity a call is about to touch,
//         buffers the call's notifications, and restores everything if the
//         call does not reach commit().
//
// @details
// Usage inside a SwapEngine operation (after the CallGate scope is open):
//
//   UnitOfWork uow(state_, assets_);      // assets_.beginUnit()
//   uow.touchAccount(maker);              // capture, then mutate
//   state_.ledger.credit(maker, ...);
//   uow.emit(ClaimCreditedEvent{...});
//   auto out = uow.commit();              // assets_.commitUnit()
//
// Every touch*() captures an image only the first time it is called for a
// given key, so the image is always the state before the call, however many
// times the call writes the entity.
//
// If the UnitOfWork is destroyed without commit(), typically while an
// EngineError unwinds through it, the destructor:
//   1. writes every captured image back into EngineState,
//   2. calls assets_.abortUnit() so backend transfers are reverted too,
//   3. discards the buffered notifications.
//
// A caller must touch an entity BEFORE mutating it. An untouched mutation
// survives a rollback.
//
// Thread model:
//   Lives on the stack of one call, under the engine's CallGate.
// -----------------------------------------------------------------------------
class UnitOfWork {
 public:
  UnitOfWork(EngineState& state, IAssetTransfer& assets);
  ~UnitOfWork();

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  void touchOrder(domain::OrderId id);
  void touchCounters();
  void touchAccount(const domain::PrincipalId& principal);
  void touchFeeBucket(const domain::AssetId& asset);

  // Allowlist, global fee configuration and creation switch.
  void touchAdmin();

  void emit(Notification notification);

  // Commits the backend unit and hands back the buffered notifications in
  // emission order. After commit() the destructor does nothing.
  std::vector<Notification> commit();

  bool committed() const { return committed_; }

 private:
  struct AdminImage {
    AllowlistRegistry allowlist;
    domain::FeeSnapshot fee_config;
    bool disabled;
  };

  void rollback() noexcept;

  EngineState& state_;
  IAssetTransfer& assets_;

  std::map<domain::OrderId, std::optional<domain::Order>> orders_;
  std::optional<OrderStore::Counters> counters_;
  std::map<domain::PrincipalId, std::optional<ClaimableLedger::Account>>
      accounts_;
  std::map<domain::AssetId, domain::Amount> fee_buckets_;
  std::optional<AdminImage> admin_;

  std::vector<Notification> pending_;
  bool committed_{false};
};

}  // namespace escrow
