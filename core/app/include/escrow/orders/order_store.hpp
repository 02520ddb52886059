#pragma once

#include "escrow/domain/order.hpp"
#include "escrow/domain/order_status.hpp"
#include "escrow/domain/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// OrderStore: order slots, id sequence and the cleanup cursor
// -----------------------------------------------------------------------------
//
// @brief  Holds every live order keyed by its sequence number, hands out new
//         ids and validates lifecycle transitions.
//
// @details
// Slots:
//   An id in [0, nextId()) is either occupied (present in the map) or a
//   tombstone (absent). An id >= nextId() has never been assigned. A
//   tombstone is never reoccupied: insert() always takes nextId().
//
// Cursor:
//   cursor() is the first id the cleanup sweep has not yet passed. It only
//   moves forward, one slot at a time, and never beyond nextId(). Every id
//   below the cursor is a tombstone.
//
//   ids:      0    1    2    3    4    5
//   slots:   [ ]  [ ]  [A]  [ ]  [F]  [A]      [ ] = tombstone
//                       ^                  ^
//                    cursor()           nextId()
//
// Transitions:
//   transitionAllowed() encodes the lifecycle graph from order_status.hpp.
//   transition() applies a status change to a stored order and refuses any
//   edge the graph does not contain.
//
// Rollback:
//   slot()/restoreSlot() and counters()/restoreCounters() give UnitOfWork a
//   way to put one slot, or the id/cursor pair, back as it was.
//
// Thread model:
//   Not synchronised. Owned by SwapEngine and only touched under its
//   CallGate.
// -----------------------------------------------------------------------------
class OrderStore {
 public:
  struct Counters {
    domain::OrderId next_id{0};
    domain::OrderId cursor{0};
  };

  // One page of activeOrders(): the Active orders found and the id at which
  // the next page starts (nextId() once the range is exhausted).
  struct Page {
    std::vector<domain::Order> orders;
    domain::OrderId next_offset{0};
  };

  // Stores the order under nextId() and returns that id. The order's id and
  // status fields are overwritten (id assigned, status Active).
  domain::OrderId insert(domain::Order order);

  const domain::Order* find(domain::OrderId id) const;

  // Returns true if id was assigned and its slot has since been deleted.
  bool isTombstone(domain::OrderId id) const;

  // Deletes an occupied slot. Throws State if the slot is not occupied.
  void tombstone(domain::OrderId id);

  // Moves the order at id to `next`. Throws State "Order does not exist" for
  // an empty slot and "Order is not active" for an edge not in the graph.
  // Returns the status the order held before.
  domain::OrderStatus transition(domain::OrderId id, domain::OrderStatus next);

  // Records the principal that filled the order.
  void setCounterparty(domain::OrderId id, const domain::PrincipalId& filler);

  domain::OrderId nextId() const { return counters_.next_id; }
  domain::OrderId cursor() const { return counters_.cursor; }

  // Moves the cursor one slot forward. Throws State if it already sits at
  // nextId() and InvariantGuard if the slot it leaves is still occupied.
  void advanceCursor();

  // Active orders with id >= max(offset, cursor()), at most `limit` of them.
  Page activeOrders(domain::OrderId offset, std::size_t limit) const;

  std::size_t liveCount() const { return orders_.size(); }

  // Lifecycle graph. Deletion is not a status and is not covered here.
  static bool transitionAllowed(domain::OrderStatus current,
                                domain::OrderStatus next);

  // --- Rollback hooks -------------------------------------------------------
  std::optional<domain::Order> slot(domain::OrderId id) const;
  void restoreSlot(domain::OrderId id, std::optional<domain::Order> image);
  Counters counters() const { return counters_; }
  void restoreCounters(const Counters& counters) { counters_ = counters; }

 private:
  domain::Order& occupied(domain::OrderId id);

  std::map<domain::OrderId, domain::Order> orders_;
  Counters counters_;
};

}  // namespace escrow
