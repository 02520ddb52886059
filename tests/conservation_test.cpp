// =============================================================================
// conservation_test.cpp
// =============================================================================
// Custody solvency across a mixed run of engine calls.
//
// Validates, after every step and for every asset:
//
//   custody balance == sum of claimable balances
//                    + fee liability
//                    + sell_amount of every Active order
//
// including steps that fail and are rolled back.
// =============================================================================

#include "support/engine_fixture.hpp"

#include <string>
#include <vector>

using escrow::AssetBehavior;
using escrow::EngineError;
using escrow::domain::Amount;
using escrow::domain::OrderStatus;
using escrow::test_support::EngineFixture;
using escrow::test_support::kOwner;

namespace {

const std::vector<std::string> kAssets = {"ALPHA", "BETA", "FEE", "NOOP"};
const std::vector<std::string> kPrincipals = {"alice", "bob", "carol",
                                              "sweeper"};

}  // namespace

class ConservationTest : public EngineFixture {
 protected:
  void SetUp() override {
    for (const auto& principal : {"alice", "bob", "carol"}) {
      fund(principal, "ALPHA", 10'000);
      fund(principal, "BETA", 10'000);
      fund(principal, "FEE", 100);
      fund(principal, "NOOP", 10'000);
    }
  }

  Amount owed(const std::string& asset) const {
    Amount total = engine.feeLiability(asset);
    for (const auto& principal : kPrincipals) {
      total += engine.claimable(principal, asset);
    }
    const auto page = engine.activeOrders(0, 1000);
    for (const auto& order : page.orders) {
      if (order.status == OrderStatus::Active && order.sell_asset == asset) {
        total += order.sell_amount;
      }
    }
    return total;
  }

  void expectSolvent(const std::string& step) {
    for (const auto& asset : kAssets) {
      EXPECT_EQ(custodyBalance(asset), owed(asset))
          << "asset " << asset << " after " << step;
    }
    EXPECT_EQ(assets.openUnits(), 0u) << step;
  }

  // Runs a call that may legitimately fail; either way the books balance.
  template <typename Fn>
  void step(const std::string& name, Fn&& fn) {
    try {
      fn();
    } catch (const EngineError&) {
    }
    expectSolvent(name);
  }
};

TEST_F(ConservationTest, MixedSequenceStaysSolvent) {
  expectSolvent("start");

  const auto o0 = engine.createOrder("alice", std::nullopt, "ALPHA", 500,
                                     "BETA", 250);
  expectSolvent("create o0");
  const auto o1 = engine.createOrder("bob", std::string("carol"), "BETA", 300,
                                     "ALPHA", 100);
  expectSolvent("create o1");
  const auto o2 = engine.createOrder("carol", std::nullopt, "NOOP", 50,
                                     "FEE", 5);
  expectSolvent("create o2");

  engine.fillOrder(o0, "bob");
  expectSolvent("fill o0");

  step("fill o1 by wrong taker", [&] { engine.fillOrder(o1, "alice"); });
  engine.fillOrder(o1, "carol");
  expectSolvent("fill o1");

  engine.cancelOrder(o2, "carol");
  expectSolvent("cancel o2");

  engine.updateFeeConfig(kOwner, "ALPHA", 7);
  const auto o3 = engine.createOrder("alice", std::nullopt, "ALPHA", 1000,
                                     "NOOP", 10);
  expectSolvent("create o3 with fee in sell asset");

  // Noop sell leg on fill: the whole fill is rolled back.
  const auto o4 = engine.createOrder("carol", std::nullopt, "NOOP", 40,
                                     "BETA", 10);
  assets.setBehavior("NOOP", AssetBehavior::SilentNoop);
  step("noop fill o4", [&] { engine.fillOrder(o4, "alice"); });
  step("noop withdraw", [&] { engine.withdraw("carol", "NOOP", 50); });
  assets.setBehavior("NOOP", AssetBehavior::Standard);

  passExpiryAndGrace();
  for (int i = 0; i < 5; ++i) {
    step("cleanup " + std::to_string(i), [&] { engine.cleanup("sweeper"); });
  }
  EXPECT_EQ(engine.firstOrderId(), engine.nextOrderId());
  EXPECT_FALSE(engine.order(o3).has_value());

  step("withdraw carol NOOP", [&] { engine.withdraw("carol", "NOOP", 20); });
  step("withdraw all carol", [&] { engine.withdrawAllClaims("carol"); });
  step("withdraw all alice", [&] { engine.withdrawAllClaims("alice", 1); });
  step("withdraw all sweeper", [&] { engine.withdrawAllClaims("sweeper"); });
  step("withdraw all alice again", [&] { engine.withdrawAllClaims("alice"); });

  for (const auto& asset : kAssets) {
    EXPECT_EQ(custodyBalance(asset), 0u) << asset;
    EXPECT_EQ(engine.feeLiability(asset), 0u) << asset;
  }
}
