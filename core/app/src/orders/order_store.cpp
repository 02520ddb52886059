#include "escrow/orders/order_store.hpp"
#include "escrow/domain/engine_error.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace escrow {

// -----------------------------------------------------------------------------
// transitionAllowed: the lifecycle graph
// -----------------------------------------------------------------------------
bool OrderStore::transitionAllowed(domain::OrderStatus current,
                                   domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Active:
      return next == S::Filled ||
             next == S::Canceled;

    case S::Filled:
    case S::Canceled:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// insert: assign the next id and store the order Active
// -----------------------------------------------------------------------------
domain::OrderId OrderStore::insert(domain::Order order) {
  const domain::OrderId id = counters_.next_id;
  order.id = id;
  order.status = domain::OrderStatus::Active;
  orders_.emplace(id, std::move(order));
  ++counters_.next_id;
  return id;
}

const domain::Order* OrderStore::find(domain::OrderId id) const {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

bool OrderStore::isTombstone(domain::OrderId id) const {
  return id < counters_.next_id && orders_.count(id) == 0;
}

domain::Order& OrderStore::occupied(domain::OrderId id) {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw EngineError(ErrorKind::State, "Order does not exist");
  }
  return it->second;
}

void OrderStore::tombstone(domain::OrderId id) {
  occupied(id);
  orders_.erase(id);
}

// -----------------------------------------------------------------------------
// transition: validated status change
// -----------------------------------------------------------------------------
domain::OrderStatus OrderStore::transition(domain::OrderId id,
                                           domain::OrderStatus next) {
  domain::Order& order = occupied(id);
  const domain::OrderStatus previous = order.status;
  if (!transitionAllowed(previous, next)) {
    throw EngineError(ErrorKind::State, "Order is not active");
  }
  order.status = next;
  return previous;
}

void OrderStore::setCounterparty(domain::OrderId id,
                                 const domain::PrincipalId& filler) {
  occupied(id).counterparty = filler;
}

// -----------------------------------------------------------------------------
// advanceCursor: forward-only, never past an occupied slot
// -----------------------------------------------------------------------------
void OrderStore::advanceCursor() {
  if (counters_.cursor >= counters_.next_id) {
    throw EngineError(ErrorKind::State, "No orders to clean up");
  }
  if (orders_.count(counters_.cursor) != 0) {
    throw EngineError(ErrorKind::InvariantGuard,
                      "Cursor cannot pass live order " +
                          std::to_string(counters_.cursor));
  }
  ++counters_.cursor;
}

// -----------------------------------------------------------------------------
// activeOrders: paginated scan of live slots
// -----------------------------------------------------------------------------
OrderStore::Page OrderStore::activeOrders(domain::OrderId offset,
                                          std::size_t limit) const {
  Page page;
  page.next_offset = counters_.next_id;

  auto it = orders_.lower_bound(std::max(offset, counters_.cursor));
  for (; it != orders_.end(); ++it) {
    if (page.orders.size() == limit) {
      page.next_offset = it->first;
      break;
    }
    if (it->second.status == domain::OrderStatus::Active) {
      page.orders.push_back(it->second);
    }
  }
  return page;
}

// -----------------------------------------------------------------------------
// Rollback hooks
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderStore::slot(domain::OrderId id) const {
  const domain::Order* order = find(id);
  if (order == nullptr) {
    return std::nullopt;
  }
  return *order;
}

void OrderStore::restoreSlot(domain::OrderId id,
                             std::optional<domain::Order> image) {
  if (image.has_value()) {
    orders_[id] = std::move(*image);
  } else {
    orders_.erase(id);
  }
}

}  // namespace escrow
