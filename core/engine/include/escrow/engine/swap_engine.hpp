#pragma once

#include "escrow/assets/i_asset_transfer.hpp"
#include "escrow/concurrent/call_gate.hpp"
#include "escrow/config/engine_config.hpp"
#include "escrow/domain/engine_limits.hpp"
#include "escrow/domain/order.hpp"
#include "escrow/domain/types.hpp"
#include "escrow/engine/engine_state.hpp"
#include "escrow/eventbus/notification_bus.hpp"
#include "escrow/events/notification.hpp"
#include "escrow/ledger/claimable_ledger.hpp"
#include "escrow/orders/order_store.hpp"
#include "escrow/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace escrow {

class UnitOfWork;

// -----------------------------------------------------------------------------
// CleanupOutcome: what one cleanup() call did
// -----------------------------------------------------------------------------
enum class CleanupOutcome {
  Cleaned,           // Order at the cursor deleted, caller rewarded
  SkippedTombstone,  // Cursor sat on an already-deleted slot; moved past it
  NotYetEligible,    // Head order still inside expiry + grace; nothing done
};

inline const char* cleanupOutcomeToString(CleanupOutcome outcome) {
  switch (outcome) {
    case CleanupOutcome::Cleaned:          return "cleaned";
    case CleanupOutcome::SkippedTombstone: return "skipped_tombstone";
    case CleanupOutcome::NotYetEligible:   return "not_yet_eligible";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// SwapEngine
// -----------------------------------------------------------------------------
//
// @brief  Escrow swap engine: order lifecycle, claimable ledger settlement,
//         fee accounting, FIFO cleanup and owner administration.
//
// @details
// Value flow:
//
//   createOrder  maker --fee, sell--> custody        (measured deltas)
//   fillOrder    taker --buy--> maker,  custody --sell--> taker
//   cancelOrder  ledger credit to maker              (no transfer)
//   cleanup      ledger credits to maker and caller  (no transfer)
//   withdraw*    custody --claim--> principal        (ledger debited first)
//
// Call protocol for every mutating operation:
//
//   1. CallGate::Scope          same-thread re-entry -> Reentrancy error,
//                               other threads wait.
//   2. checks                   validation, authorization, state.
//   3. UnitOfWork               captures each entity before it is written.
//   4. effects                  engine state written.
//   5. interactions             IAssetTransfer calls, each verified by
//                               balance delta.
//   6. commit                   backend unit committed, notifications
//                               stamped with sequence ids.
//   7. scope released, then notifications published on the bus.
//
// createOrder is the one exception to 4-before-5: what it stores depends on
// the measured deltas, so it transfers first and writes after. The gate
// keeps anything from observing the half-done call.
//
// Any EngineError thrown during 2-6 unwinds through the UnitOfWork, which
// restores engine state and aborts the backend unit: a rejected call has no
// effect and publishes nothing. withdrawAllClaims() is the one call that
// commits per asset; see its comment.
//
// Backend failures (a std::exception thrown by the IAssetTransfer, a false or
// zero report, a balance delta that does not match) are all reported as
// ExternalEffect.
//
// Reads take a CallGate::ReadScope: they wait for a call running on another
// thread, and pass straight through when made from inside a transfer
// callback on the calling thread, where they see the state already written
// by the outer call.
//
// Thread model:
//   Every public member is safe to call from any thread.
//
// Ownership:
//   Owns EngineState, the CallGate and the NotificationBus.
//   Borrows the IAssetTransfer and the ITimeProvider; both must outlive it.
// -----------------------------------------------------------------------------
class SwapEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  owner, custody principal, initial fee configuration,
  //                 initial allowlist and limits. Validated here; an invalid
  //                 config throws ConfigError, an invalid allowlist
  //                 EngineError(Validation).
  // @param  assets  Asset backend. Custody balances live under
  //                 config.custody.
  // @param  clock   Source of now_ms() for creation stamps and windows.
  // -------------------------------------------------------------------------
  SwapEngine(const EngineConfig& config, IAssetTransfer& assets,
             const ITimeProvider& clock);

  SwapEngine(const SwapEngine&) = delete;
  SwapEngine& operator=(const SwapEngine&) = delete;
  SwapEngine(SwapEngine&&) = delete;
  SwapEngine& operator=(SwapEngine&&) = delete;

  // =========================================================================
  // Order lifecycle
  // =========================================================================

  // -------------------------------------------------------------------------
  // createOrder(maker, counterparty, sell_asset, sell_amount, buy_asset,
  //             buy_amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Escrows sell_amount of sell_asset plus the current creation fee
  //         and stores a new Active order.
  //
  // @param  counterparty  If set (and non-empty) only this principal may
  //                       fill the order.
  //
  // @return The new order id.
  //
  // @details
  // Rejections, in check order:
  //   State       "Order creation is disabled"
  //   Validation  null maker, null or equal assets, zero amounts,
  //               asset not allowlisted, insufficient allowance to custody
  //               for the sell amount and the fee (summed when the fee asset
  //               is the sell asset).
  //   External    fee or sell transfer throws, reports zero, or moves
  //               nothing / more than requested into custody.
  //
  // The order stores the sell amount and fee actually received by custody.
  // Emits OrderCreatedEvent.
  // -------------------------------------------------------------------------
  domain::OrderId createOrder(
      const domain::PrincipalId& maker,
      const std::optional<domain::PrincipalId>& counterparty,
      const domain::AssetId& sell_asset, domain::Amount sell_amount,
      const domain::AssetId& buy_asset, domain::Amount buy_amount);

  // -------------------------------------------------------------------------
  // fillOrder(id, caller)
  // -------------------------------------------------------------------------
  //
  // @brief  Settles both legs: buy_amount from caller to maker, the escrowed
  //         sell_amount from custody to caller.
  //
  // @details
  // Requires an Active order, now <= created_at + order_expiry_ms, caller
  // equal to the restricted counterparty if one is set, and an allowance to
  // custody covering buy_amount. The order is marked Filled with caller as
  // its counterparty before any transfer runs. The maker must receive
  // exactly buy_amount and custody must release exactly sell_amount, or the
  // whole fill is rolled back (ExternalEffect).
  // Emits OrderFilledEvent.
  // -------------------------------------------------------------------------
  void fillOrder(domain::OrderId id, const domain::PrincipalId& caller);

  // Marks an Active order Canceled and credits the escrow to the maker's
  // claimable ledger. Only the maker may cancel; there is no deadline.
  // Emits OrderCanceledEvent and ClaimCreditedEvent(OrderCanceled).
  void cancelOrder(domain::OrderId id, const domain::PrincipalId& caller);

  // -------------------------------------------------------------------------
  // cleanup(caller)
  // -------------------------------------------------------------------------
  //
  // @brief  Processes exactly the order slot at the cursor.
  //
  // @details
  //   cursor == nextOrderId()            State "No orders to clean up"
  //   slot is a tombstone                advance cursor -> SkippedTombstone
  //   now <= created + expiry + grace    nothing        -> NotYetEligible
  //   otherwise                                         -> Cleaned:
  //     Active order: escrow credited to maker (OrderExpired)
  //     fee released from FeeAccounting and credited to caller
  //     (CleanupReward); slot tombstoned; cursor advanced.
  //
  // Strict FIFO: a later eligible order waits behind an ineligible head.
  // Never transfers, so a misbehaving asset cannot block the sweep.
  // Emits ClaimCreditedEvent(s) and OrderCleanedUpEvent when Cleaned.
  // -------------------------------------------------------------------------
  CleanupOutcome cleanup(const domain::PrincipalId& caller);

  // =========================================================================
  // Claimable ledger settlement
  // =========================================================================

  // Debits `amount` of `asset` from caller's claimable balance and sends it
  // from custody. Validation for a null asset, zero amount or an amount above
  // the balance; ExternalEffect if custody does not release exactly
  // `amount`. Emits ClaimWithdrawnEvent.
  void withdraw(const domain::PrincipalId& caller, const domain::AssetId& asset,
                domain::Amount amount);

  // -------------------------------------------------------------------------
  // withdrawAllClaims(caller, max_assets)
  // -------------------------------------------------------------------------
  //
  // @brief  Withdraws the full balance of up to max_assets claimable assets,
  //         walking the caller's asset list from the back.
  //
  // @return Number of assets whose balance was withdrawn.
  //
  // @details
  // Each list entry visited counts toward max_assets, including a stale
  // zero-balance entry, which is dropped without a transfer.
  //
  // Every asset is settled in its own UnitOfWork. On the first failure the
  // failing asset's unit is rolled back, the walk stops, the notifications
  // of the assets already settled are published, and the error is rethrown.
  // Settled assets stay drained; the failing asset and every asset after it
  // keep their balances.
  //
  // max_assets == 0 is rejected with Validation "Invalid maxAssets".
  // -------------------------------------------------------------------------
  std::size_t withdrawAllClaims(const domain::PrincipalId& caller,
                                std::size_t max_assets);

  // Same, capped at limits().default_withdraw_batch.
  std::size_t withdrawAllClaims(const domain::PrincipalId& caller);

  // =========================================================================
  // Administration (owner only; Authorization "Caller is not the owner")
  // =========================================================================

  // Replaces the fee charged to orders created from now on. Existing orders
  // keep their snapshot. Emits FeeConfigUpdatedEvent.
  void updateFeeConfig(const domain::PrincipalId& caller,
                       const domain::AssetId& fee_asset,
                       domain::Amount fee_amount);

  // Stops / resumes order creation. Fill, cancel, cleanup and withdrawals
  // keep working while disabled. A redundant toggle is a State error.
  // Emits CreationSwitchChangedEvent.
  void disableCreation(const domain::PrincipalId& caller);
  void enableCreation(const domain::PrincipalId& caller);

  // Batch allowlist update; see AllowlistRegistry::update(). Returns the
  // number of entries whose membership changed, each of which emits an
  // AllowlistUpdatedEvent.
  std::size_t updateAllowlist(const domain::PrincipalId& caller,
                              const std::vector<domain::AssetId>& assets,
                              const std::vector<bool>& allowed);

  // =========================================================================
  // Read surface
  // =========================================================================

  std::optional<domain::Order> order(domain::OrderId id) const;
  bool isTombstone(domain::OrderId id) const;
  // Up to `limit` Active orders from max(offset, firstOrderId()). Resume
  // from next_offset. limit == 0 is rejected with Validation "Invalid limit".
  OrderStore::Page activeOrders(domain::OrderId offset,
                                std::size_t limit) const;
  domain::OrderId firstOrderId() const;
  domain::OrderId nextOrderId() const;

  bool isAllowed(const domain::AssetId& asset) const;
  std::vector<domain::AssetId> allowedAssets() const;
  std::size_t allowedAssetCount() const;

  domain::Amount claimable(const domain::PrincipalId& principal,
                           const domain::AssetId& asset) const;
  std::vector<domain::AssetId> claimableAssets(
      const domain::PrincipalId& principal) const;
  bool hasClaimableAsset(const domain::PrincipalId& principal,
                         const domain::AssetId& asset) const;

  domain::Amount feeLiability(const domain::AssetId& asset) const;
  domain::FeeSnapshot feeConfig() const;
  bool isDisabled() const;

  const domain::PrincipalId& owner() const { return owner_; }
  const domain::PrincipalId& custody() const { return custody_; }
  const domain::EngineLimits& limits() const { return limits_; }

  NotificationBus& notificationBus() { return bus_; }

 private:
  void requireOwner(const domain::PrincipalId& caller) const;

  // Pulls `amount` from `from` into custody and returns the custody delta.
  domain::Amount pullIntoCustody(const domain::AssetId& asset,
                                 const domain::PrincipalId& from,
                                 domain::Amount amount, const char* leg);

  // Sends exactly `amount` from custody to `to`.
  void sendFromCustody(const domain::AssetId& asset,
                       const domain::PrincipalId& to, domain::Amount amount,
                       const char* leg);

  void creditClaim(UnitOfWork& uow, const domain::PrincipalId& principal,
                   const domain::AssetId& asset, domain::Amount amount,
                   CreditReason reason, std::optional<domain::OrderId> order_id,
                   Timestamp stamp);

  void settleWithdrawal(UnitOfWork& uow, const domain::PrincipalId& caller,
                        const domain::AssetId& asset, domain::Amount amount,
                        Timestamp stamp);

  // Commits the unit and assigns sequence ids. Call under the gate.
  std::vector<Notification> commit(UnitOfWork& uow);

  // Delivers committed notifications. Call after the gate is released.
  void publish(const std::vector<Notification>& notifications);

  Timestamp stampNow() const;

  domain::PrincipalId owner_;
  domain::PrincipalId custody_;
  domain::EngineLimits limits_;

  IAssetTransfer& assets_;
  const ITimeProvider& clock_;

  EngineState state_;
  std::uint64_t next_sequence_id_{1};

  mutable CallGate gate_;
  NotificationBus bus_;
};

}  // namespace escrow
