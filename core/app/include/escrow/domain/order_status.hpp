#pragma once

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: escrow order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  The three states an order slot can hold while it is occupied.
//
// @details
//
//   (none) ──create──> Active ──fill────> Filled ───cleanup──> (tombstone)
//                        │
//                        ├────cancel──> Canceled ─cleanup──> (tombstone)
//                        │
//                        └────cleanup (expired + grace) ────> (tombstone)
//
// Filled and Canceled are terminal for trading: no further transition is
// accepted except deletion by the cleanup sweep. Deletion is not a status;
// a deleted slot is simply absent from the OrderStore (a tombstone).
//
// Thread model:
//   Plain enum, value semantics.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Active,    // Escrow held, fillable until expiry, cancelable forever
  Filled,    // Both legs settled with a counterparty
  Canceled,  // Maker reclaimed the escrow through the claimable ledger
};

inline const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Active:   return "Active";
    case OrderStatus::Filled:   return "Filled";
    case OrderStatus::Canceled: return "Canceled";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace escrow
