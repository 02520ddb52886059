// =============================================================================
// adverse_asset_test.cpp
// =============================================================================
// SwapEngine against assets that do not behave: taxed, silent no-op, paused
// and refusing transfers, and transfers that call back into the engine.
//
// Validates:
//   - createOrder stores the measured sell amount and fee
//   - fillOrder requires both legs to be exact, else the whole fill reverts
//   - A failed leg reverts the legs that ran before it
//   - Re-entrant mutating calls are rejected, reads see in-flight state
// =============================================================================

#include "support/engine_fixture.hpp"

#include <optional>
#include <string>

using escrow::AssetBehavior;
using escrow::EngineError;
using escrow::ErrorKind;
using escrow::OrderCreatedEvent;
using escrow::domain::OrderStatus;
using escrow::test_support::EngineFixture;
using escrow::test_support::expectEngineError;
using escrow::test_support::kOwner;

class AdverseAssetTest : public EngineFixture {
 protected:
  void SetUp() override {
    fund("alice", "ALPHA", 1000);
    fund("alice", "FEE", 10);
    fund("bob", "BETA", 1000);
  }

  void TearDown() override { assets.setTransferHook(nullptr); }

  // Everything a failed call must have left untouched.
  void expectUntouched(escrow::domain::Amount alice_fee) {
    EXPECT_EQ(balance("alice", "FEE"), alice_fee);
    EXPECT_EQ(engine.feeLiability("FEE"), 0u);
    EXPECT_EQ(engine.nextOrderId(), 0u);
    EXPECT_EQ(assets.openUnits(), 0u);
    EXPECT_TRUE(notifications.empty());
  }
};

// -----------------------------------------------------------------------------
// Taxed sell leg: the order escrows what custody actually received.
// -----------------------------------------------------------------------------
TEST_F(AdverseAssetTest, TaxedSellRecordsReceivedAmount) {
  fund("alice", "TAXED", 1000);
  assets.setBehavior("TAXED", AssetBehavior::Taxed, 100);

  const auto id =
      engine.createOrder("alice", std::nullopt, "TAXED", 1000, "BETA", 50);

  const auto order = engine.order(id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->sell_amount, 990u);
  EXPECT_EQ(custodyBalance("TAXED"), 990u);
  EXPECT_EQ(balance("alice", "TAXED"), 0u);
  EXPECT_EQ(notificationsOf<OrderCreatedEvent>()[0].order.sell_amount, 990u);

  // Custody releases exactly the recorded amount; the taker bears the tax.
  engine.fillOrder(id, "bob");
  EXPECT_EQ(custodyBalance("TAXED"), 0u);
  EXPECT_EQ(balance("bob", "TAXED"), 981u);
}

TEST_F(AdverseAssetTest, TaxedFeeRecordsReceivedFee) {
  fund("alice", "TAXED", 1000);
  engine.updateFeeConfig(kOwner, "TAXED", 100);
  assets.setBehavior("TAXED", AssetBehavior::Taxed, 100);

  const auto id = createDefaultOrder();

  EXPECT_EQ(engine.order(id)->fee.amount, 99u);
  EXPECT_EQ(engine.feeLiability("TAXED"), 99u);
  EXPECT_EQ(custodyBalance("TAXED"), 99u);
}

// -----------------------------------------------------------------------------
// Taxed buy leg: the maker would be short, so the fill is refused.
// -----------------------------------------------------------------------------
TEST_F(AdverseAssetTest, TaxedBuyLegRevertsFill) {
  fund("bob", "TAXED", 1000);
  assets.setBehavior("TAXED", AssetBehavior::Taxed, 100);
  const auto id =
      engine.createOrder("alice", std::nullopt, "ALPHA", 100, "TAXED", 200);
  notifications.clear();

  expectEngineError([&] { engine.fillOrder(id, "bob"); },
                    ErrorKind::ExternalEffect,
                    "Buy transfer did not deliver the exact amount");

  EXPECT_EQ(engine.order(id)->status, OrderStatus::Active);
  EXPECT_FALSE(engine.order(id)->counterparty.has_value());
  EXPECT_EQ(balance("bob", "TAXED"), 1000u);
  EXPECT_EQ(balance("alice", "TAXED"), 0u);
  EXPECT_EQ(custodyBalance("ALPHA"), 100u);
  EXPECT_EQ(assets.openUnits(), 0u);
  EXPECT_TRUE(notifications.empty());
}

TEST_F(AdverseAssetTest, SilentNoopSellIsRejected) {
  fund("alice", "NOOP", 1000);
  assets.setBehavior("NOOP", AssetBehavior::SilentNoop);

  expectEngineError(
      [&] {
        engine.createOrder("alice", std::nullopt, "NOOP", 100, "BETA", 1);
      },
      ErrorKind::ExternalEffect, "No sell amount received");
  expectUntouched(10);
}

TEST_F(AdverseAssetTest, RefusingSellIsRejected) {
  fund("alice", "REFUSING", 1000);
  assets.setBehavior("REFUSING", AssetBehavior::Refusing);

  expectEngineError(
      [&] {
        engine.createOrder("alice", std::nullopt, "REFUSING", 100, "BETA", 1);
      },
      ErrorKind::ExternalEffect, "No sell amount received");
  expectUntouched(10);
}

TEST_F(AdverseAssetTest, PausedSellIsRejected) {
  fund("alice", "PAUSED", 1000);
  assets.setBehavior("PAUSED", AssetBehavior::Paused);

  expectEngineError(
      [&] {
        engine.createOrder("alice", std::nullopt, "PAUSED", 100, "BETA", 1);
      },
      ErrorKind::ExternalEffect);
  expectUntouched(10);
  EXPECT_EQ(balance("alice", "PAUSED"), 1000u);
}

TEST_F(AdverseAssetTest, PausedFeeAssetBlocksCreation) {
  assets.setBehavior("FEE", AssetBehavior::Paused);
  expectEngineError([&] { createDefaultOrder(); }, ErrorKind::ExternalEffect);
  expectUntouched(10);
  EXPECT_EQ(balance("alice", "ALPHA"), 1000u);
}

// -----------------------------------------------------------------------------
// A no-op sell leg on fill: the buy leg already ran and must be undone.
// -----------------------------------------------------------------------------
TEST_F(AdverseAssetTest, NoopSellLegOnFillRevertsBuyLeg) {
  fund("alice", "NOOP", 1000);
  const auto id =
      engine.createOrder("alice", std::nullopt, "NOOP", 100, "BETA", 200);
  assets.setBehavior("NOOP", AssetBehavior::SilentNoop);
  notifications.clear();

  expectEngineError([&] { engine.fillOrder(id, "bob"); },
                    ErrorKind::ExternalEffect,
                    "sell transfer did not release the exact amount");

  EXPECT_EQ(balance("bob", "BETA"), 1000u);
  EXPECT_EQ(balance("alice", "BETA"), 0u);
  EXPECT_EQ(custodyBalance("NOOP"), 100u);
  EXPECT_EQ(engine.order(id)->status, OrderStatus::Active);
  EXPECT_TRUE(notifications.empty());
}

// -----------------------------------------------------------------------------
// Self-fill: the maker pays itself, so its balance does not grow.
// -----------------------------------------------------------------------------
TEST_F(AdverseAssetTest, SelfFillIsRejected) {
  fund("alice", "BETA", 1000);
  const auto id = createDefaultOrder();

  expectEngineError([&] { engine.fillOrder(id, "alice"); },
                    ErrorKind::ExternalEffect,
                    "Buy transfer did not deliver the exact amount");
  EXPECT_EQ(engine.order(id)->status, OrderStatus::Active);
  EXPECT_EQ(balance("alice", "BETA"), 1000u);
}

// -----------------------------------------------------------------------------
// Re-entry from inside a transfer.
// -----------------------------------------------------------------------------
TEST_F(AdverseAssetTest, ReentrantCallFailsOuterCall) {
  const auto canceled = createDefaultOrder();
  engine.cancelOrder(canceled, "alice");
  const auto id = createDefaultOrder();
  notifications.clear();

  bool fired = false;
  assets.setTransferHook([&](const std::string& asset) {
    if (asset == "BETA" && !fired) {
      fired = true;
      engine.withdraw("alice", "ALPHA", 100);
    }
  });

  expectEngineError([&] { engine.fillOrder(id, "bob"); },
                    ErrorKind::Reentrancy, "Reentrant call to withdraw");

  EXPECT_TRUE(fired);
  EXPECT_EQ(engine.order(id)->status, OrderStatus::Active);
  EXPECT_EQ(engine.claimable("alice", "ALPHA"), 100u);
  EXPECT_EQ(balance("bob", "BETA"), 1000u);
  EXPECT_EQ(assets.openUnits(), 0u);
  EXPECT_TRUE(notifications.empty());
}

TEST_F(AdverseAssetTest, ContainedReentryLetsOuterCallFinish) {
  const auto id = createDefaultOrder();

  std::optional<ErrorKind> rejected;
  assets.setTransferHook([&](const std::string& asset) {
    if (asset != "BETA" || rejected.has_value()) {
      return;
    }
    try {
      engine.createOrder("alice", std::nullopt, "ALPHA", 1, "BETA", 1);
    } catch (const EngineError& e) {
      rejected = e.kind();
    }
  });

  engine.fillOrder(id, "bob");

  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(*rejected, ErrorKind::Reentrancy);
  EXPECT_EQ(engine.order(id)->status, OrderStatus::Filled);
  EXPECT_EQ(engine.nextOrderId(), 1u);
}

TEST_F(AdverseAssetTest, ReadFromTransferSeesFilledOrder) {
  const auto id = createDefaultOrder();

  std::optional<OrderStatus> seen;
  std::optional<std::string> seen_taker;
  assets.setTransferHook([&](const std::string& asset) {
    if (asset == "BETA" && !seen.has_value()) {
      const auto order = engine.order(id);
      seen = order->status;
      seen_taker = order->counterparty;
    }
  });

  engine.fillOrder(id, "bob");

  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(*seen, OrderStatus::Filled);
  EXPECT_EQ(seen_taker, std::optional<std::string>("bob"));
}
