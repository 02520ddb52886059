// =============================================================================
// order_store_test.cpp
// =============================================================================
// Unit tests for escrow::OrderStore.
//
// Validates:
//   - Sequential ids starting at 0; insert() forces status Active
//   - The lifecycle graph: Active -> Filled | Canceled, nothing else
//   - Tombstones are permanent and never reoccupied
//   - The cleanup cursor moves forward only, never over a live slot
//   - Pagination of Active orders
// =============================================================================

#include "escrow/domain/engine_error.hpp"
#include "escrow/orders/order_store.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>

using escrow::EngineError;
using escrow::ErrorKind;
using escrow::OrderStore;
using escrow::domain::Order;
using escrow::domain::OrderStatus;

namespace {

Order makeOrder(const std::string& maker) {
  Order order;
  order.maker = maker;
  order.sell_asset = "ALPHA";
  order.sell_amount = 100;
  order.buy_asset = "BETA";
  order.buy_amount = 50;
  order.status = OrderStatus::Canceled;  // overwritten by insert()
  return order;
}

ErrorKind kindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const EngineError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected EngineError";
  return ErrorKind::Validation;
}

}  // namespace

class OrderStoreTest : public ::testing::Test {
 protected:
  OrderStore store;
};

TEST_F(OrderStoreTest, InsertAssignsSequentialIds) {
  EXPECT_EQ(store.insert(makeOrder("alice")), 0u);
  EXPECT_EQ(store.insert(makeOrder("bob")), 1u);
  EXPECT_EQ(store.nextId(), 2u);

  const Order* order = store.find(1);
  ASSERT_NE(order, nullptr);
  EXPECT_EQ(order->id, 1u);
  EXPECT_EQ(order->maker, "bob");
  EXPECT_EQ(order->status, OrderStatus::Active);
}

// -----------------------------------------------------------------------------
// Lifecycle graph: only Active has outgoing edges.
// -----------------------------------------------------------------------------
TEST(OrderStoreGraphTest, TransitionAllowed) {
  EXPECT_TRUE(OrderStore::transitionAllowed(OrderStatus::Active,
                                            OrderStatus::Filled));
  EXPECT_TRUE(OrderStore::transitionAllowed(OrderStatus::Active,
                                            OrderStatus::Canceled));
  EXPECT_FALSE(OrderStore::transitionAllowed(OrderStatus::Active,
                                             OrderStatus::Active));
  for (auto from : {OrderStatus::Filled, OrderStatus::Canceled}) {
    for (auto to :
         {OrderStatus::Active, OrderStatus::Filled, OrderStatus::Canceled}) {
      EXPECT_FALSE(OrderStore::transitionAllowed(from, to));
    }
  }
}

TEST_F(OrderStoreTest, TransitionReturnsPreviousAndRejectsTerminal) {
  const auto id = store.insert(makeOrder("alice"));

  EXPECT_EQ(store.transition(id, OrderStatus::Filled), OrderStatus::Active);
  EXPECT_EQ(store.find(id)->status, OrderStatus::Filled);

  EXPECT_EQ(kindOf([&] { store.transition(id, OrderStatus::Canceled); }),
            ErrorKind::State);
  EXPECT_EQ(store.find(id)->status, OrderStatus::Filled);
}

TEST_F(OrderStoreTest, TransitionOnMissingSlot) {
  try {
    store.transition(5, OrderStatus::Canceled);
    FAIL() << "expected State error";
  } catch (const EngineError& e) {
    EXPECT_STREQ(e.what(), "Order does not exist");
  }
}

TEST_F(OrderStoreTest, SetCounterpartyRecordsFiller) {
  const auto id = store.insert(makeOrder("alice"));
  store.setCounterparty(id, "bob");
  ASSERT_TRUE(store.find(id)->counterparty.has_value());
  EXPECT_EQ(*store.find(id)->counterparty, "bob");
}

// -----------------------------------------------------------------------------
// Tombstones: absent forever, ids keep increasing.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, TombstoneIsPermanent) {
  const auto id = store.insert(makeOrder("alice"));
  store.tombstone(id);

  EXPECT_EQ(store.find(id), nullptr);
  EXPECT_TRUE(store.isTombstone(id));
  EXPECT_FALSE(store.isTombstone(id + 1));  // never assigned
  EXPECT_EQ(kindOf([&] { store.tombstone(id); }), ErrorKind::State);
  EXPECT_EQ(kindOf([&] { store.transition(id, OrderStatus::Filled); }),
            ErrorKind::State);

  EXPECT_EQ(store.insert(makeOrder("bob")), id + 1);
  EXPECT_TRUE(store.isTombstone(id));
}

TEST_F(OrderStoreTest, CursorAdvancesOnlyOverTombstones) {
  store.insert(makeOrder("alice"));
  store.insert(makeOrder("bob"));

  EXPECT_EQ(kindOf([&] { store.advanceCursor(); }), ErrorKind::InvariantGuard);
  EXPECT_EQ(store.cursor(), 0u);

  store.tombstone(0);
  store.advanceCursor();
  EXPECT_EQ(store.cursor(), 1u);

  store.tombstone(1);
  store.advanceCursor();
  EXPECT_EQ(store.cursor(), 2u);

  EXPECT_EQ(kindOf([&] { store.advanceCursor(); }), ErrorKind::State);
}

// -----------------------------------------------------------------------------
// Pagination skips non-Active orders and everything behind the cursor.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, ActiveOrdersPagination) {
  for (int i = 0; i < 6; ++i) {
    store.insert(makeOrder("m" + std::to_string(i)));
  }
  store.transition(1, OrderStatus::Filled);
  store.tombstone(0);
  store.advanceCursor();
  store.tombstone(3);

  auto first = store.activeOrders(0, 2);
  ASSERT_EQ(first.orders.size(), 2u);
  EXPECT_EQ(first.orders[0].id, 2u);
  EXPECT_EQ(first.orders[1].id, 4u);
  EXPECT_EQ(first.next_offset, 5u);

  auto second = store.activeOrders(first.next_offset, 2);
  ASSERT_EQ(second.orders.size(), 1u);
  EXPECT_EQ(second.orders[0].id, 5u);
  EXPECT_EQ(second.next_offset, store.nextId());
}

TEST_F(OrderStoreTest, RestoreSlotAndCounters) {
  store.insert(makeOrder("alice"));
  const auto counters = store.counters();
  const auto image = store.slot(0);
  const auto empty = store.slot(1);

  store.transition(0, OrderStatus::Canceled);
  store.insert(makeOrder("bob"));

  store.restoreSlot(0, image);
  store.restoreSlot(1, empty);
  store.restoreCounters(counters);

  EXPECT_EQ(store.find(0)->status, OrderStatus::Active);
  EXPECT_EQ(store.find(1), nullptr);
  EXPECT_EQ(store.nextId(), 1u);
  EXPECT_EQ(store.liveCount(), 1u);
}
