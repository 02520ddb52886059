#pragma once

#include "escrow/config/engine_config.hpp"
#include "escrow/domain/types.hpp"
#include "escrow/ledger/claimable_ledger.hpp"
#include "escrow/ledger/fee_accounting.hpp"
#include "escrow/orders/order_store.hpp"
#include "escrow/registry/allowlist_registry.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// EngineState: every piece of process-wide state a SwapEngine mutates
// -----------------------------------------------------------------------------
// Grouped in one struct so UnitOfWork can capture and restore any of it
// through a single reference. The asset backend is not part of it; its
// effects are undone through IAssetTransfer::abortUnit().
// -----------------------------------------------------------------------------
struct EngineState {
  explicit EngineState(const EngineConfig& config)
      : allowlist(config.allowed_assets), fee_config(config.fee) {}

  AllowlistRegistry allowlist;
  ClaimableLedger ledger;
  FeeAccounting fees;
  OrderStore orders;
  domain::FeeSnapshot fee_config;
  bool disabled{false};
};

}  // namespace escrow
