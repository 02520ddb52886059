#pragma once

#include "escrow/domain/engine_limits.hpp"
#include "escrow/domain/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// ConfigError: malformed or incomplete engine configuration
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// SeedBalance: starting balance minted into the AssetBook by the executable
// -----------------------------------------------------------------------------
// approve_custody additionally grants the custody principal an allowance of
// the same amount, so the seeded principal can create or fill orders at once.
// -----------------------------------------------------------------------------
struct SeedBalance {
  domain::AssetId asset;
  domain::PrincipalId principal;
  domain::Amount amount{0};
  bool approve_custody{true};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything needed to construct a SwapEngine and its IPC surface.
//
// @details
// JSON layout (every key except owner, custody, fee and allowed_assets is
// optional and falls back to the default shown):
//
//   {
//     "owner":          "admin",
//     "custody":        "escrow",
//     "fee":            { "asset": "FEE", "amount": 1 },
//     "allowed_assets": ["A", "B", "FEE"],
//     "limits": {
//       "order_expiry_ms":        604800000,
//       "grace_period_ms":        604800000,
//       "max_allowlist_batch":    100,
//       "default_withdraw_batch": 50
//     },
//     "ipc": {
//       "command_endpoint":   "tcp://127.0.0.1:5556",
//       "telemetry_endpoint": "tcp://127.0.0.1:5557"
//     },
//     "seed_balances": [
//       { "asset": "A", "principal": "alice", "amount": 1000 }
//     ]
//   }
//
// validate() enforces the constraints the engine relies on; parse and load
// call it, and throw ConfigError with the offending key on failure.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::PrincipalId owner;
  domain::PrincipalId custody;
  domain::FeeSnapshot fee;
  std::vector<domain::AssetId> allowed_assets;
  domain::EngineLimits limits;

  // Empty endpoints disable the IpcServer.
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::vector<SeedBalance> seed_balances;

  void validate() const;
};

EngineConfig parseEngineConfig(const nlohmann::json& json);
EngineConfig parseEngineConfigText(const std::string& text);
EngineConfig loadEngineConfig(const std::string& path);

nlohmann::json toJson(const EngineConfig& config);

}  // namespace escrow
