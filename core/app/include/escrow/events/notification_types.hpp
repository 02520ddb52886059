#pragma once

#include "escrow/domain/order.hpp"
#include "escrow/domain/order_status.hpp"
#include "escrow/domain/types.hpp"
#include "escrow/ledger/claimable_ledger.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace escrow {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time carried by every notification. Filled from
// ITimeProvider::now_ms() through ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Notifications
// -----------------------------------------------------------------------------
// Each struct is a plain value snapshot of one committed state change. The
// engine buffers them inside the unit of work and publishes them on the
// NotificationBus only after the call commits, so a subscriber never sees a
// change that was later rolled back.
//
// sequence_id is assigned when the call commits, starting at 1, and is
// gap-free and strictly increasing per engine. Notifications of one call are
// delivered in order; those of calls committed on different threads may
// arrive interleaved, and sequence_id restores the commit order.
//
// Every notification carries enough data (ids, principals, assets, amounts,
// reasons) for an indexer to rebuild the engine's state without querying it.
// -----------------------------------------------------------------------------

// Order stored Active. `order` is the stored record, including the measured
// sell amount and the fee snapshot.
struct OrderCreatedEvent {
  domain::Order order;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Both legs settled.
struct OrderFilledEvent {
  domain::OrderId order_id{0};
  domain::PrincipalId maker;
  domain::PrincipalId taker;
  domain::AssetId sell_asset;
  domain::Amount sell_amount{0};
  domain::AssetId buy_asset;
  domain::Amount buy_amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Maker canceled; the escrow was credited to the maker (see the matching
// ClaimCreditedEvent).
struct OrderCanceledEvent {
  domain::OrderId order_id{0};
  domain::PrincipalId maker;
  domain::AssetId sell_asset;
  domain::Amount sell_amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Slot tombstoned by the cleanup sweep. previous_status is the status the
// order held when it was deleted.
struct OrderCleanedUpEvent {
  domain::OrderId order_id{0};
  domain::PrincipalId caller;
  domain::OrderStatus previous_status{domain::OrderStatus::Active};
  domain::AssetId fee_asset;
  domain::Amount fee_amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct FeeConfigUpdatedEvent {
  domain::AssetId fee_asset;
  domain::Amount fee_amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// One entry whose membership actually changed.
struct AllowlistUpdatedEvent {
  domain::AssetId asset;
  bool allowed{false};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct CreationSwitchChangedEvent {
  bool disabled{false};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// order_id is empty for credits that are not tied to one order.
struct ClaimCreditedEvent {
  domain::PrincipalId principal;
  domain::AssetId asset;
  domain::Amount amount{0};
  CreditReason reason{CreditReason::OrderCanceled};
  std::optional<domain::OrderId> order_id;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct ClaimWithdrawnEvent {
  domain::PrincipalId principal;
  domain::AssetId asset;
  domain::Amount amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace escrow
