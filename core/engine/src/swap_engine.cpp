#include "escrow/engine/swap_engine.hpp"
#include "escrow/domain/checked_amount.hpp"
#include "escrow/domain/engine_error.hpp"
#include "escrow/engine/unit_of_work.hpp"
#include "escrow/time/time_utils.hpp"

#include <exception>
#include <iterator>
#include <iostream>
#include <string>
#include <utility>

namespace escrow {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
  config.validate();
  return config;
}

// Runs one backend call. A backend exception becomes ExternalEffect; an
// EngineError (a rejected re-entrant call from inside the transfer) passes
// through unchanged.
template <typename Call>
auto external(const char* what, Call&& call) -> decltype(call()) {
  try {
    return call();
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& e) {
    throw EngineError(ErrorKind::ExternalEffect,
                      std::string(what) + " failed: " + e.what());
  }
}

void requireValue(bool condition, const char* reason) {
  if (!condition) {
    throw EngineError(ErrorKind::Validation, reason);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SwapEngine::SwapEngine(const EngineConfig& config, IAssetTransfer& assets,
                       const ITimeProvider& clock)
    : owner_(validated(config).owner),
      custody_(config.custody),
      limits_(config.limits),
      assets_(assets),
      clock_(clock),
      state_(config) {
  std::cout << "[SwapEngine] ready. owner=" << owner_
            << " custody=" << custody_
            << " allowed_assets=" << state_.allowlist.count()
            << " fee=" << state_.fee_config.amount << " "
            << state_.fee_config.asset << "\n";
}

// =============================================================================
// Order lifecycle
// =============================================================================

// -----------------------------------------------------------------------------
// createOrder(): checks, measured pulls, then store
// -----------------------------------------------------------------------------
domain::OrderId SwapEngine::createOrder(
    const domain::PrincipalId& maker,
    const std::optional<domain::PrincipalId>& counterparty,
    const domain::AssetId& sell_asset, domain::Amount sell_amount,
    const domain::AssetId& buy_asset, domain::Amount buy_amount) {
  std::vector<Notification> committed;
  domain::OrderId id = 0;
  {
    CallGate::Scope scope(gate_, "createOrder");

    if (state_.disabled) {
      throw EngineError(ErrorKind::State, "Order creation is disabled");
    }
    requireValue(!domain::isNull(maker), "Invalid maker");
    requireValue(!domain::isNull(sell_asset), "Invalid sell asset");
    requireValue(sell_amount > 0, "Invalid sell amount");
    requireValue(!domain::isNull(buy_asset), "Invalid buy asset");
    requireValue(buy_amount > 0, "Invalid buy amount");
    requireValue(sell_asset != buy_asset, "Cannot swap same asset");
    requireValue(state_.allowlist.isAllowed(sell_asset),
                 "Sell asset not allowed");
    requireValue(state_.allowlist.isAllowed(buy_asset),
                 "Buy asset not allowed");

    const domain::FeeSnapshot fee = state_.fee_config;
    const domain::Amount sell_allowance = external("allowance", [&] {
      return assets_.allowance(sell_asset, maker, custody_);
    });
    if (fee.asset == sell_asset) {
      const domain::Amount needed =
          domain::checkedAdd(sell_amount, fee.amount, "required allowance");
      requireValue(sell_allowance >= needed,
                   "Insufficient allowance for sell asset");
    } else {
      requireValue(sell_allowance >= sell_amount,
                   "Insufficient allowance for sell asset");
      const domain::Amount fee_allowance = external("allowance", [&] {
        return assets_.allowance(fee.asset, maker, custody_);
      });
      requireValue(fee_allowance >= fee.amount,
                   "Insufficient allowance for fee");
    }

    UnitOfWork uow(state_, assets_);
    const Timestamp stamp = stampNow();

    const domain::Amount fee_received =
        pullIntoCustody(fee.asset, maker, fee.amount, "fee");
    const domain::Amount sell_received =
        pullIntoCustody(sell_asset, maker, sell_amount, "sell");

    uow.touchFeeBucket(fee.asset);
    state_.fees.accrue(fee.asset, fee_received);

    domain::Order order;
    order.maker = maker;
    if (counterparty.has_value() && !domain::isNull(*counterparty)) {
      order.counterparty = *counterparty;
    }
    order.sell_asset = sell_asset;
    order.sell_amount = sell_received;
    order.buy_asset = buy_asset;
    order.buy_amount = buy_amount;
    order.created_at_ms = clock_.now_ms();
    order.fee = domain::FeeSnapshot{fee.asset, fee_received};

    uow.touchCounters();
    uow.touchOrder(state_.orders.nextId());
    id = state_.orders.insert(std::move(order));

    uow.emit(OrderCreatedEvent{*state_.orders.find(id), stamp});
    committed = commit(uow);
  }
  publish(committed);
  return id;
}

// -----------------------------------------------------------------------------
// fillOrder(): mark Filled, then settle both legs exactly
// -----------------------------------------------------------------------------
void SwapEngine::fillOrder(domain::OrderId id,
                           const domain::PrincipalId& caller) {
  std::vector<Notification> committed;
  {
    CallGate::Scope scope(gate_, "fillOrder");

    requireValue(!domain::isNull(caller), "Invalid caller");
    const domain::Order* stored = state_.orders.find(id);
    if (stored == nullptr) {
      throw EngineError(ErrorKind::State, "Order does not exist");
    }
    if (stored->status != domain::OrderStatus::Active) {
      throw EngineError(ErrorKind::State, "Order is not active");
    }
    if (clock_.now_ms() - stored->created_at_ms > limits_.order_expiry_ms) {
      throw EngineError(ErrorKind::State, "Order has expired");
    }
    if (stored->counterparty.has_value() && *stored->counterparty != caller) {
      throw EngineError(ErrorKind::Authorization,
                        "Not authorized to fill this order");
    }
    const domain::Order order = *stored;

    const domain::Amount buy_allowance = external("allowance", [&] {
      return assets_.allowance(order.buy_asset, caller, custody_);
    });
    requireValue(buy_allowance >= order.buy_amount,
                 "Insufficient allowance for buy asset");

    UnitOfWork uow(state_, assets_);
    const Timestamp stamp = stampNow();

    uow.touchOrder(id);
    state_.orders.transition(id, domain::OrderStatus::Filled);
    state_.orders.setCounterparty(id, caller);

    // Buy leg: measured at the maker, the party that must receive it.
    const domain::Amount maker_before = external("balanceOf", [&] {
      return assets_.balanceOf(order.buy_asset, order.maker);
    });
    const domain::Amount reported = external("buy transfer", [&] {
      return assets_.transferIn(order.buy_asset, caller, order.maker,
                                order.buy_amount);
    });
    const domain::Amount maker_after = external("balanceOf", [&] {
      return assets_.balanceOf(order.buy_asset, order.maker);
    });
    if (reported != order.buy_amount || maker_after < maker_before ||
        maker_after - maker_before != order.buy_amount) {
      throw EngineError(ErrorKind::ExternalEffect,
                        "Buy transfer did not deliver the exact amount");
    }

    // Sell leg: the escrow leaves custody.
    sendFromCustody(order.sell_asset, caller, order.sell_amount, "sell");

    uow.emit(OrderFilledEvent{id, order.maker, caller, order.sell_asset,
                              order.sell_amount, order.buy_asset,
                              order.buy_amount, stamp});
    committed = commit(uow);
  }
  publish(committed);
}

// -----------------------------------------------------------------------------
// cancelOrder(): state change plus ledger credit, no transfer
// -----------------------------------------------------------------------------
void SwapEngine::cancelOrder(domain::OrderId id,
                             const domain::PrincipalId& caller) {
  std::vector<Notification> committed;
  {
    CallGate::Scope scope(gate_, "cancelOrder");

    const domain::Order* stored = state_.orders.find(id);
    if (stored == nullptr) {
      throw EngineError(ErrorKind::State, "Order does not exist");
    }
    if (stored->status != domain::OrderStatus::Active) {
      throw EngineError(ErrorKind::State, "Order is not active");
    }
    if (stored->maker != caller) {
      throw EngineError(ErrorKind::Authorization,
                        "Only maker can cancel order");
    }
    const domain::Order order = *stored;

    UnitOfWork uow(state_, assets_);
    const Timestamp stamp = stampNow();

    uow.touchOrder(id);
    state_.orders.transition(id, domain::OrderStatus::Canceled);
    creditClaim(uow, order.maker, order.sell_asset, order.sell_amount,
                CreditReason::OrderCanceled, id, stamp);

    uow.emit(OrderCanceledEvent{id, order.maker, order.sell_asset,
                                order.sell_amount, stamp});
    committed = commit(uow);
  }
  publish(committed);
}

// -----------------------------------------------------------------------------
// cleanup(): one slot per call, strictly FIFO
// -----------------------------------------------------------------------------
CleanupOutcome SwapEngine::cleanup(const domain::PrincipalId& caller) {
  std::vector<Notification> committed;
  CleanupOutcome outcome = CleanupOutcome::NotYetEligible;
  {
    CallGate::Scope scope(gate_, "cleanup");

    requireValue(!domain::isNull(caller), "Invalid caller");
    const domain::OrderId head = state_.orders.cursor();
    if (head >= state_.orders.nextId()) {
      throw EngineError(ErrorKind::State, "No orders to clean up");
    }

    if (state_.orders.isTombstone(head)) {
      UnitOfWork uow(state_, assets_);
      uow.touchCounters();
      state_.orders.advanceCursor();
      committed = commit(uow);
      outcome = CleanupOutcome::SkippedTombstone;
    } else {
      const domain::Order order = *state_.orders.find(head);
      // Compared as an age so large windows cannot overflow.
      const domain::TimestampMs age = clock_.now_ms() - order.created_at_ms;
      if (age > limits_.order_expiry_ms &&
          age - limits_.order_expiry_ms > limits_.grace_period_ms) {
        UnitOfWork uow(state_, assets_);
        const Timestamp stamp = stampNow();

        if (order.status == domain::OrderStatus::Active) {
          creditClaim(uow, order.maker, order.sell_asset, order.sell_amount,
                      CreditReason::OrderExpired, head, stamp);
        }

        uow.touchFeeBucket(order.fee.asset);
        state_.fees.release(order.fee.asset, order.fee.amount);
        creditClaim(uow, caller, order.fee.asset, order.fee.amount,
                    CreditReason::CleanupReward, head, stamp);

        uow.touchOrder(head);
        uow.touchCounters();
        state_.orders.tombstone(head);
        state_.orders.advanceCursor();

        uow.emit(OrderCleanedUpEvent{head, caller, order.status,
                                     order.fee.asset, order.fee.amount,
                                     stamp});
        committed = commit(uow);
        outcome = CleanupOutcome::Cleaned;
      }
    }
  }
  publish(committed);
  return outcome;
}

// =============================================================================
// Claimable ledger settlement
// =============================================================================

void SwapEngine::withdraw(const domain::PrincipalId& caller,
                          const domain::AssetId& asset,
                          domain::Amount amount) {
  std::vector<Notification> committed;
  {
    CallGate::Scope scope(gate_, "withdraw");

    requireValue(!domain::isNull(caller), "Invalid caller");
    requireValue(!domain::isNull(asset), "Invalid asset");
    requireValue(amount > 0, "Invalid amount");

    UnitOfWork uow(state_, assets_);
    settleWithdrawal(uow, caller, asset, amount, stampNow());
    committed = commit(uow);
  }
  publish(committed);
}

// -----------------------------------------------------------------------------
// withdrawAllClaims(): one unit per asset, stop at the first failure
// -----------------------------------------------------------------------------
std::size_t SwapEngine::withdrawAllClaims(const domain::PrincipalId& caller,
                                          std::size_t max_assets) {
  std::vector<Notification> committed;
  std::exception_ptr failure;
  std::size_t drained = 0;
  {
    CallGate::Scope scope(gate_, "withdrawAllClaims");

    requireValue(!domain::isNull(caller), "Invalid caller");
    requireValue(max_assets > 0, "Invalid maxAssets");

    const Timestamp stamp = stampNow();
    for (std::size_t visited = 0; visited < max_assets; ++visited) {
      const std::optional<domain::AssetId> asset =
          state_.ledger.lastAsset(caller);
      if (!asset.has_value()) {
        break;
      }
      const domain::Amount amount = state_.ledger.claimable(caller, *asset);

      UnitOfWork uow(state_, assets_);
      try {
        if (amount == 0) {
          uow.touchAccount(caller);
          state_.ledger.dropStale(caller, *asset);
        } else {
          settleWithdrawal(uow, caller, *asset, amount, stamp);
          ++drained;
        }
        auto settled = commit(uow);
        committed.insert(committed.end(),
                         std::make_move_iterator(settled.begin()),
                         std::make_move_iterator(settled.end()));
      } catch (const EngineError& e) {
        std::cerr << "[SwapEngine] withdrawAllClaims for " << caller
                  << " stopped at " << *asset << " after " << drained
                  << " asset(s): " << e.what() << "\n";
        failure = std::current_exception();
        break;
      }
    }
  }
  publish(committed);
  if (failure) {
    std::rethrow_exception(failure);
  }
  return drained;
}

std::size_t SwapEngine::withdrawAllClaims(const domain::PrincipalId& caller) {
  return withdrawAllClaims(caller, limits_.default_withdraw_batch);
}

// =============================================================================
// Administration
// =============================================================================

void SwapEngine::requireOwner(const domain::PrincipalId& caller) const {
  if (caller != owner_) {
    throw EngineError(ErrorKind::Authorization, "Caller is not the owner");
  }
}

void SwapEngine::updateFeeConfig(const domain::PrincipalId& caller,
                                 const domain::AssetId& fee_asset,
                                 domain::Amount fee_amount) {
  std::vector<Notification> committed;
  {
    CallGate::Scope scope(gate_, "updateFeeConfig");

    requireOwner(caller);
    requireValue(!domain::isNull(fee_asset), "Invalid fee asset");
    requireValue(fee_amount > 0, "Invalid fee amount");

    UnitOfWork uow(state_, assets_);
    uow.touchAdmin();
    state_.fee_config = domain::FeeSnapshot{fee_asset, fee_amount};
    uow.emit(FeeConfigUpdatedEvent{fee_asset, fee_amount, stampNow()});
    committed = commit(uow);
  }
  publish(committed);
}

void SwapEngine::disableCreation(const domain::PrincipalId& caller) {
  std::vector<Notification> committed;
  {
    CallGate::Scope scope(gate_, "disableCreation");

    requireOwner(caller);
    if (state_.disabled) {
      throw EngineError(ErrorKind::State, "Creation already disabled");
    }

    UnitOfWork uow(state_, assets_);
    uow.touchAdmin();
    state_.disabled = true;
    uow.emit(CreationSwitchChangedEvent{true, stampNow()});
    committed = commit(uow);
  }
  publish(committed);
}

void SwapEngine::enableCreation(const domain::PrincipalId& caller) {
  std::vector<Notification> committed;
  {
    CallGate::Scope scope(gate_, "enableCreation");

    requireOwner(caller);
    if (!state_.disabled) {
      throw EngineError(ErrorKind::State, "Creation already enabled");
    }

    UnitOfWork uow(state_, assets_);
    uow.touchAdmin();
    state_.disabled = false;
    uow.emit(CreationSwitchChangedEvent{false, stampNow()});
    committed = commit(uow);
  }
  publish(committed);
}

std::size_t SwapEngine::updateAllowlist(
    const domain::PrincipalId& caller,
    const std::vector<domain::AssetId>& assets,
    const std::vector<bool>& allowed) {
  std::vector<Notification> committed;
  std::size_t changed = 0;
  {
    CallGate::Scope scope(gate_, "updateAllowlist");

    requireOwner(caller);

    UnitOfWork uow(state_, assets_);
    uow.touchAdmin();
    const auto changes =
        state_.allowlist.update(assets, allowed, limits_.max_allowlist_batch);

    const Timestamp stamp = stampNow();
    for (const auto& [asset, now_allowed] : changes) {
      uow.emit(AllowlistUpdatedEvent{asset, now_allowed, stamp});
    }
    changed = changes.size();
    committed = commit(uow);
  }
  publish(committed);
  return changed;
}

// =============================================================================
// Read surface
// =============================================================================

std::optional<domain::Order> SwapEngine::order(domain::OrderId id) const {
  CallGate::ReadScope scope(gate_);
  return state_.orders.slot(id);
}

bool SwapEngine::isTombstone(domain::OrderId id) const {
  CallGate::ReadScope scope(gate_);
  return state_.orders.isTombstone(id);
}

OrderStore::Page SwapEngine::activeOrders(domain::OrderId offset,
                                          std::size_t limit) const {
  requireValue(limit > 0, "Invalid limit");
  CallGate::ReadScope scope(gate_);
  return state_.orders.activeOrders(offset, limit);
}

domain::OrderId SwapEngine::firstOrderId() const {
  CallGate::ReadScope scope(gate_);
  return state_.orders.cursor();
}

domain::OrderId SwapEngine::nextOrderId() const {
  CallGate::ReadScope scope(gate_);
  return state_.orders.nextId();
}

bool SwapEngine::isAllowed(const domain::AssetId& asset) const {
  CallGate::ReadScope scope(gate_);
  return state_.allowlist.isAllowed(asset);
}

std::vector<domain::AssetId> SwapEngine::allowedAssets() const {
  CallGate::ReadScope scope(gate_);
  return state_.allowlist.list();
}

std::size_t SwapEngine::allowedAssetCount() const {
  CallGate::ReadScope scope(gate_);
  return state_.allowlist.count();
}

domain::Amount SwapEngine::claimable(const domain::PrincipalId& principal,
                                     const domain::AssetId& asset) const {
  CallGate::ReadScope scope(gate_);
  return state_.ledger.claimable(principal, asset);
}

std::vector<domain::AssetId> SwapEngine::claimableAssets(
    const domain::PrincipalId& principal) const {
  CallGate::ReadScope scope(gate_);
  return state_.ledger.claimableAssets(principal);
}

bool SwapEngine::hasClaimableAsset(const domain::PrincipalId& principal,
                                   const domain::AssetId& asset) const {
  CallGate::ReadScope scope(gate_);
  return state_.ledger.hasClaimableAsset(principal, asset);
}

domain::Amount SwapEngine::feeLiability(const domain::AssetId& asset) const {
  CallGate::ReadScope scope(gate_);
  return state_.fees.liability(asset);
}

domain::FeeSnapshot SwapEngine::feeConfig() const {
  CallGate::ReadScope scope(gate_);
  return state_.fee_config;
}

bool SwapEngine::isDisabled() const {
  CallGate::ReadScope scope(gate_);
  return state_.disabled;
}

// =============================================================================
// Internals
// =============================================================================

// -----------------------------------------------------------------------------
// pullIntoCustody(): inbound transfer verified by custody balance delta
// -----------------------------------------------------------------------------
domain::Amount SwapEngine::pullIntoCustody(const domain::AssetId& asset,
                                           const domain::PrincipalId& from,
                                           domain::Amount amount,
                                           const char* leg) {
  const std::string what = std::string(leg) + " transfer";
  const domain::Amount before = external("balanceOf", [&] {
    return assets_.balanceOf(asset, custody_);
  });
  const domain::Amount reported = external(what.c_str(), [&] {
    return assets_.transferIn(asset, from, custody_, amount);
  });
  const domain::Amount after = external("balanceOf", [&] {
    return assets_.balanceOf(asset, custody_);
  });

  if (reported == 0 || after <= before) {
    throw EngineError(ErrorKind::ExternalEffect,
                      "No " + std::string(leg) + " amount received");
  }
  const domain::Amount received = after - before;
  if (received > amount) {
    throw EngineError(ErrorKind::ExternalEffect,
                      "Received more " + std::string(leg) +
                          " than requested");
  }
  return received;
}

// -----------------------------------------------------------------------------
// sendFromCustody(): outbound transfer verified by custody balance delta
// -----------------------------------------------------------------------------
void SwapEngine::sendFromCustody(const domain::AssetId& asset,
                                 const domain::PrincipalId& to,
                                 domain::Amount amount, const char* leg) {
  const std::string what = std::string(leg) + " transfer";
  const domain::Amount before = external("balanceOf", [&] {
    return assets_.balanceOf(asset, custody_);
  });
  const bool ok = external(what.c_str(), [&] {
    return assets_.transferOut(asset, custody_, to, amount);
  });
  const domain::Amount after = external("balanceOf", [&] {
    return assets_.balanceOf(asset, custody_);
  });

  if (!ok) {
    throw EngineError(ErrorKind::ExternalEffect,
                      std::string(leg) + " transfer reported failure");
  }
  if (after > before || before - after != amount) {
    throw EngineError(ErrorKind::ExternalEffect,
                      std::string(leg) +
                          " transfer did not release the exact amount");
  }
}

void SwapEngine::creditClaim(UnitOfWork& uow,
                             const domain::PrincipalId& principal,
                             const domain::AssetId& asset,
                             domain::Amount amount, CreditReason reason,
                             std::optional<domain::OrderId> order_id,
                             Timestamp stamp) {
  uow.touchAccount(principal);
  if (state_.ledger.credit(principal, asset, amount)) {
    uow.emit(ClaimCreditedEvent{principal, asset, amount, reason, order_id,
                                stamp});
  }
}

// -----------------------------------------------------------------------------
// settleWithdrawal(): debit first, then send
// -----------------------------------------------------------------------------
void SwapEngine::settleWithdrawal(UnitOfWork& uow,
                                  const domain::PrincipalId& caller,
                                  const domain::AssetId& asset,
                                  domain::Amount amount, Timestamp stamp) {
  uow.touchAccount(caller);
  state_.ledger.debit(caller, asset, amount);
  sendFromCustody(asset, caller, amount, "withdraw");
  uow.emit(ClaimWithdrawnEvent{caller, asset, amount, stamp});
}

std::vector<Notification> SwapEngine::commit(UnitOfWork& uow) {
  std::vector<Notification> out = uow.commit();
  for (auto& notification : out) {
    std::visit([this](auto& e) { e.sequence_id = next_sequence_id_++; },
               notification);
  }
  return out;
}

void SwapEngine::publish(const std::vector<Notification>& notifications) {
  for (const auto& notification : notifications) {
    bus_.publish(notification);
  }
}

Timestamp SwapEngine::stampNow() const {
  return ms_to_timestamp(clock_.now_ms());
}

}  // namespace escrow
