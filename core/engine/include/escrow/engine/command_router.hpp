#pragma once

#include "escrow/engine/swap_engine.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// CommandRouter: JSON request/reply surface over a SwapEngine
// -----------------------------------------------------------------------------
//
// @brief  Decodes one JSON request, runs the matching SwapEngine operation and
//         encodes the outcome as a JSON reply.
//
// @details
// Request:  {"cmd": "<name>", ...arguments}
// Reply:    {"status": "ok", ...results}
//           {"status": "error", "kind": "<kind>", "reason": "<text>"}
//
// "kind" is errorKindToString() of the EngineError the engine threw, or
// "bad_request" for text that is not a JSON object, a missing or unknown
// "cmd", or an argument that is missing or of the wrong type.
//
// Commands (arguments in parentheses):
//   ping
//   status
//   create_order      (maker, counterparty?, sell_asset, sell_amount,
//                      buy_asset, buy_amount)                  -> order_id
//   fill_order        (order_id, caller)
//   cancel_order      (order_id, caller)
//   cleanup           (caller)                                 -> outcome
//   withdraw          (caller, asset, amount)
//   withdraw_all      (caller, max_assets?)                    -> withdrawn
//   update_fee_config (caller, fee_asset, fee_amount)
//   disable / enable  (caller)
//   update_allowlist  (caller, assets[], allowed[])            -> changed
//   get_order         (order_id)                               -> order
//   active_orders     (offset?, limit?)          -> orders, next_offset
//   allowlist                                                  -> assets
//   claimable         (principal, asset)                       -> amount
//   claimable_assets  (principal)                              -> assets
//   fee_liability     (asset)                                  -> amount
//
// Rejected requests are logged to std::cerr.
//
// Thread model:
//   handle() is called on the IpcServer worker thread. The SwapEngine's
//   CallGate serialises it against every other caller.
// -----------------------------------------------------------------------------
class CommandRouter {
 public:
  explicit CommandRouter(SwapEngine& engine);

  CommandRouter(const CommandRouter&) = delete;
  CommandRouter& operator=(const CommandRouter&) = delete;

  std::string handle(const std::string& request);

 private:
  using Handler = std::function<void(const nlohmann::json&, nlohmann::json&)>;

  static constexpr std::size_t kDefaultPageSize = 100;

  void registerHandlers();

  SwapEngine& engine_;
  std::map<std::string, Handler> handlers_;
};

}  // namespace escrow
