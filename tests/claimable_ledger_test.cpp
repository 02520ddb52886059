// =============================================================================
// claimable_ledger_test.cpp
// =============================================================================
// Unit tests for escrow::ClaimableLedger.
//
// Validates:
//   - credit() accumulates and never overwrites; zero is a no-op
//   - debit() bounds and list removal at zero
//   - The per-principal asset list tracks exactly the non-zero balances
//   - Rollback hooks restore a principal's account image
// =============================================================================

#include "escrow/domain/engine_error.hpp"
#include "escrow/ledger/claimable_ledger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>

using escrow::ClaimableLedger;
using escrow::EngineError;
using escrow::ErrorKind;

class ClaimableLedgerTest : public ::testing::Test {
 protected:
  ClaimableLedger ledger;
};

// -----------------------------------------------------------------------------
// 1. Two credits for the same (principal, asset) add up.
// -----------------------------------------------------------------------------
TEST_F(ClaimableLedgerTest, CreditsAccumulate) {
  EXPECT_TRUE(ledger.credit("alice", "ALPHA", 100));
  EXPECT_TRUE(ledger.credit("alice", "ALPHA", 50));

  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 150u);
  EXPECT_EQ(ledger.claimableAssets("alice"),
            (std::vector<std::string>{"ALPHA"}));
}

TEST_F(ClaimableLedgerTest, ZeroCreditIsNoop) {
  EXPECT_FALSE(ledger.credit("alice", "ALPHA", 0));

  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 0u);
  EXPECT_FALSE(ledger.hasClaimableAsset("alice", "ALPHA"));
  EXPECT_FALSE(ledger.lastAsset("alice").has_value());
}

TEST_F(ClaimableLedgerTest, CreditRejectsNullIds) {
  EXPECT_THROW(ledger.credit("", "ALPHA", 1), EngineError);
  EXPECT_THROW(ledger.credit("alice", "", 1), EngineError);
}

TEST_F(ClaimableLedgerTest, CreditOverflowIsInvariantGuard) {
  ledger.credit("alice", "ALPHA", std::numeric_limits<std::uint64_t>::max());
  try {
    ledger.credit("alice", "ALPHA", 1);
    FAIL() << "expected overflow";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvariantGuard);
  }
  EXPECT_EQ(ledger.claimable("alice", "ALPHA"),
            std::numeric_limits<std::uint64_t>::max());
}

// -----------------------------------------------------------------------------
// 2. A partial debit keeps the asset listed; the final debit removes it.
// -----------------------------------------------------------------------------
TEST_F(ClaimableLedgerTest, DebitRemovesAssetAtZero) {
  ledger.credit("alice", "ALPHA", 100);
  ledger.credit("alice", "BETA", 5);

  ledger.debit("alice", "ALPHA", 40);
  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 60u);
  EXPECT_TRUE(ledger.hasClaimableAsset("alice", "ALPHA"));

  ledger.debit("alice", "ALPHA", 60);
  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 0u);
  EXPECT_FALSE(ledger.hasClaimableAsset("alice", "ALPHA"));
  EXPECT_EQ(ledger.claimableAssets("alice"),
            (std::vector<std::string>{"BETA"}));
}

TEST_F(ClaimableLedgerTest, DebitBounds) {
  ledger.credit("alice", "ALPHA", 10);

  try {
    ledger.debit("alice", "ALPHA", 11);
    FAIL() << "expected insufficient balance";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Validation);
    EXPECT_STREQ(e.what(), "Insufficient claimable balance");
  }
  try {
    ledger.debit("alice", "ALPHA", 0);
    FAIL() << "expected invalid amount";
  } catch (const EngineError& e) {
    EXPECT_STREQ(e.what(), "Invalid amount");
  }
  EXPECT_THROW(ledger.debit("bob", "ALPHA", 1), EngineError);
  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 10u);
}

// -----------------------------------------------------------------------------
// 3. lastAsset() walks the list from the back; draining it in that order
//    empties the principal's list.
// -----------------------------------------------------------------------------
TEST_F(ClaimableLedgerTest, LastAssetWalk) {
  ledger.credit("alice", "A", 1);
  ledger.credit("alice", "B", 2);
  ledger.credit("alice", "C", 3);

  std::vector<std::string> order;
  while (auto asset = ledger.lastAsset("alice")) {
    order.push_back(*asset);
    ledger.debit("alice", *asset, ledger.claimable("alice", *asset));
  }

  EXPECT_EQ(order, (std::vector<std::string>{"C", "B", "A"}));
  EXPECT_TRUE(ledger.claimableAssets("alice").empty());
}

TEST_F(ClaimableLedgerTest, ListedIffNonZero) {
  ledger.credit("alice", "A", 1);
  ledger.credit("alice", "B", 2);
  ledger.credit("alice", "C", 3);
  ledger.debit("alice", "A", 1);
  ledger.credit("alice", "D", 4);
  ledger.debit("alice", "C", 2);

  for (const char* asset : {"A", "B", "C", "D", "E"}) {
    const auto listed = ledger.claimableAssets("alice");
    const bool in_list =
        std::find(listed.begin(), listed.end(), asset) != listed.end();
    EXPECT_EQ(in_list, ledger.claimable("alice", asset) > 0) << asset;
    EXPECT_EQ(in_list, ledger.hasClaimableAsset("alice", asset)) << asset;
  }
}

TEST_F(ClaimableLedgerTest, TotalClaimableSumsPrincipals) {
  ledger.credit("alice", "ALPHA", 10);
  ledger.credit("bob", "ALPHA", 15);
  ledger.credit("bob", "BETA", 7);

  EXPECT_EQ(ledger.totalClaimable("ALPHA"), 25u);
  EXPECT_EQ(ledger.totalClaimable("BETA"), 7u);
  EXPECT_EQ(ledger.totalClaimable("GAMMA"), 0u);
}

TEST_F(ClaimableLedgerTest, DropStaleLeavesFundedAssets) {
  ledger.credit("alice", "ALPHA", 10);
  ledger.dropStale("alice", "ALPHA");

  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 10u);
  EXPECT_TRUE(ledger.hasClaimableAsset("alice", "ALPHA"));
}

// -----------------------------------------------------------------------------
// 4. account()/restoreAccount() bring back both the balances and the list.
// -----------------------------------------------------------------------------
TEST_F(ClaimableLedgerTest, RestoreAccountImage) {
  ledger.credit("alice", "ALPHA", 10);
  auto image = ledger.account("alice");
  auto absent = ledger.account("bob");
  ASSERT_TRUE(image.has_value());
  EXPECT_FALSE(absent.has_value());

  ledger.debit("alice", "ALPHA", 10);
  ledger.credit("alice", "BETA", 3);
  ledger.credit("bob", "ALPHA", 1);

  ledger.restoreAccount("alice", image);
  ledger.restoreAccount("bob", absent);

  EXPECT_EQ(ledger.claimable("alice", "ALPHA"), 10u);
  EXPECT_EQ(ledger.claimable("alice", "BETA"), 0u);
  EXPECT_EQ(ledger.claimableAssets("alice"),
            (std::vector<std::string>{"ALPHA"}));
  EXPECT_TRUE(ledger.claimableAssets("bob").empty());
}

TEST(CreditReasonTest, Names) {
  EXPECT_STREQ(escrow::creditReasonToString(
                   escrow::CreditReason::OrderCanceled),
               "order_canceled");
  EXPECT_STREQ(escrow::creditReasonToString(
                   escrow::CreditReason::OrderExpired),
               "order_expired");
  EXPECT_STREQ(escrow::creditReasonToString(
                   escrow::CreditReason::CleanupReward),
               "cleanup_reward");
}
