// =============================================================================
// call_gate_test.cpp
// =============================================================================
// Unit tests for escrow::CallGate.
//
// Validates:
//   - Same-thread re-entry of a Scope throws Reentrancy
//   - The gate is released by the Scope destructor, also on unwinding
//   - ReadScope passes through on the holding thread and waits otherwise
//   - A second thread waits for the holder instead of failing
// =============================================================================

#include "escrow/concurrent/call_gate.hpp"
#include "escrow/domain/engine_error.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using escrow::CallGate;
using escrow::EngineError;
using escrow::ErrorKind;

TEST(CallGateTest, ReentryOnSameThreadIsRejected) {
  CallGate gate;
  CallGate::Scope outer(gate, "outer");
  EXPECT_TRUE(gate.heldByCurrentThread());

  try {
    CallGate::Scope inner(gate, "withdraw");
    FAIL() << "expected Reentrancy";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Reentrancy);
    EXPECT_STREQ(e.what(), "Reentrant call to withdraw");
  }

  // The failed inner entry did not release the outer scope.
  EXPECT_TRUE(gate.heldByCurrentThread());
}

TEST(CallGateTest, ScopeReleasesOnUnwind) {
  CallGate gate;
  try {
    CallGate::Scope scope(gate, "op");
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }

  EXPECT_FALSE(gate.heldByCurrentThread());
  CallGate::Scope again(gate, "op");
  EXPECT_TRUE(gate.heldByCurrentThread());
}

TEST(CallGateTest, ReadScopePassesThroughOnHolder) {
  CallGate gate;
  CallGate::Scope scope(gate, "op");
  {
    CallGate::ReadScope read(gate);
    EXPECT_TRUE(gate.heldByCurrentThread());
  }
  EXPECT_TRUE(gate.heldByCurrentThread());
}

// -----------------------------------------------------------------------------
// Another thread is serialised behind the holder, not rejected.
// -----------------------------------------------------------------------------
TEST(CallGateTest, OtherThreadWaitsForHolder) {
  CallGate gate;
  std::atomic<bool> entered{false};
  std::atomic<bool> read_done{false};

  std::thread other;
  {
    CallGate::Scope scope(gate, "op");
    other = std::thread([&] {
      {
        CallGate::ReadScope read(gate);
        read_done.store(true);
      }
      CallGate::Scope mine(gate, "op");
      entered.store(true);
      EXPECT_TRUE(gate.heldByCurrentThread());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(read_done.load());
    EXPECT_FALSE(entered.load());
  }

  other.join();
  EXPECT_TRUE(read_done.load());
  EXPECT_TRUE(entered.load());
  EXPECT_FALSE(gate.heldByCurrentThread());
}
