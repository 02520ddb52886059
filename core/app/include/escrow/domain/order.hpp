#pragma once

#include "escrow/domain/order_status.hpp"
#include "escrow/domain/types.hpp"

#include <optional>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: One escrowed swap offer. The maker has already paid the
// creation fee and handed sell_amount of sell_asset to engine custody; any
// counterparty (or only the restricted one) may deliver buy_amount of
// buy_asset in exchange before the order expires.
//
// @details
// sell_amount is the amount custody actually received, measured as a balance
// delta at creation. For an asset that taxes transfers it is lower than what
// the maker asked to escrow, and every later payout of this order (fill,
// cancel credit, cleanup credit) uses this measured amount.
//
// fee is copied from the global fee configuration at creation and then never
// written again; fee.amount is the measured fee delta, i.e. exactly the amount
// accrued into FeeAccounting for fee.asset.
//
// counterparty is empty for an open order. When an order is filled the
// engine writes the actual filler here, so a Filled order always names its
// counterparty.
//
// Ownership:
//   The authoritative copy lives in the OrderStore. Copies handed out by the
//   read surface or carried in notifications are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  PrincipalId maker;
  std::optional<PrincipalId> counterparty;
  AssetId sell_asset;
  Amount sell_amount{0};
  AssetId buy_asset;
  Amount buy_amount{0};
  TimestampMs created_at_ms{0};
  OrderStatus status{OrderStatus::Active};
  FeeSnapshot fee;
};

}  // namespace domain
}  // namespace escrow
