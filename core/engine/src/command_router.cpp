#include "escrow/engine/command_router.hpp"
#include "escrow/domain/engine_error.hpp"
#include "escrow/network/json_format.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace escrow {

namespace {

nlohmann::json errorReply(const std::string& kind, const std::string& reason) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["kind"] = kind;
  reply["reason"] = reason;
  return reply;
}

// A request field that is present but unusable. Answered as bad_request.
class BadArgument : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Ids, amounts and counts must arrive as non-negative JSON integers; nlohmann
// would otherwise wrap a negative integer into a huge unsigned value.
template <typename T>
T convert(const nlohmann::json& value, const char* name) {
  if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
    const bool non_negative =
        value.is_number_unsigned() ||
        (value.is_number_integer() && value.get<std::int64_t>() >= 0);
    if (!non_negative) {
      throw BadArgument(std::string("Field '") + name +
                        "' must be a non-negative integer");
    }
  }
  return value.get<T>();
}

template <typename T>
T arg(const nlohmann::json& request, const char* name) {
  return convert<T>(request.at(name), name);
}

template <typename T>
T argOr(const nlohmann::json& request, const char* name, T fallback) {
  auto it = request.find(name);
  if (it == request.end() || it->is_null()) {
    return fallback;
  }
  return convert<T>(*it, name);
}

}  // namespace

CommandRouter::CommandRouter(SwapEngine& engine) : engine_(engine) {
  registerHandlers();
}

// -----------------------------------------------------------------------------
// handle(): parse, dispatch, encode
// -----------------------------------------------------------------------------
std::string CommandRouter::handle(const std::string& request) {
  std::string cmd;
  try {
    const nlohmann::json parsed = nlohmann::json::parse(request);
    if (!parsed.is_object()) {
      throw EngineError(ErrorKind::Validation, "Request is not an object");
    }
    cmd = arg<std::string>(parsed, "cmd");

    auto it = handlers_.find(cmd);
    if (it == handlers_.end()) {
      std::cerr << "[CommandRouter] Unknown command: " << cmd << "\n";
      return errorReply("bad_request", "Unknown command: " + cmd).dump();
    }

    nlohmann::json reply;
    reply["status"] = "ok";
    it->second(parsed, reply);
    return reply.dump();
  } catch (const EngineError& e) {
    if (cmd.empty()) {
      std::cerr << "[CommandRouter] Bad request: " << e.what() << "\n";
      return errorReply("bad_request", e.what()).dump();
    }
    std::cerr << "[CommandRouter] " << cmd << " rejected ("
              << errorKindToString(e.kind()) << "): " << e.what() << "\n";
    return errorReply(errorKindToString(e.kind()), e.what()).dump();
  } catch (const BadArgument& e) {
    std::cerr << "[CommandRouter] Bad request: " << e.what() << "\n";
    return errorReply("bad_request", e.what()).dump();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CommandRouter] Bad request: " << e.what() << "\n";
    return errorReply("bad_request", e.what()).dump();
  }
}

// -----------------------------------------------------------------------------
// registerHandlers(): one entry per command name
// -----------------------------------------------------------------------------
void CommandRouter::registerHandlers() {
  handlers_["ping"] = [](const nlohmann::json&, nlohmann::json& reply) {
    reply["response"] = "pong";
  };

  handlers_["status"] = [this](const nlohmann::json&, nlohmann::json& reply) {
    const domain::FeeSnapshot fee = engine_.feeConfig();
    reply["owner"] = engine_.owner();
    reply["custody"] = engine_.custody();
    reply["disabled"] = engine_.isDisabled();
    reply["fee_asset"] = fee.asset;
    reply["fee_amount"] = fee.amount;
    reply["first_order_id"] = engine_.firstOrderId();
    reply["next_order_id"] = engine_.nextOrderId();
    reply["allowed_asset_count"] = engine_.allowedAssetCount();
  };

  // --- Order lifecycle ------------------------------------------------------
  handlers_["create_order"] = [this](const nlohmann::json& req,
                                     nlohmann::json& reply) {
    std::optional<domain::PrincipalId> counterparty;
    auto it = req.find("counterparty");
    if (it != req.end() && !it->is_null()) {
      counterparty = it->get<domain::PrincipalId>();
    }
    reply["order_id"] = engine_.createOrder(
        arg<domain::PrincipalId>(req, "maker"), counterparty,
        arg<domain::AssetId>(req, "sell_asset"),
        arg<domain::Amount>(req, "sell_amount"),
        arg<domain::AssetId>(req, "buy_asset"),
        arg<domain::Amount>(req, "buy_amount"));
  };

  handlers_["fill_order"] = [this](const nlohmann::json& req,
                                   nlohmann::json&) {
    engine_.fillOrder(arg<domain::OrderId>(req, "order_id"),
                      arg<domain::PrincipalId>(req, "caller"));
  };

  handlers_["cancel_order"] = [this](const nlohmann::json& req,
                                     nlohmann::json&) {
    engine_.cancelOrder(arg<domain::OrderId>(req, "order_id"),
                        arg<domain::PrincipalId>(req, "caller"));
  };

  handlers_["cleanup"] = [this](const nlohmann::json& req,
                                nlohmann::json& reply) {
    reply["outcome"] = cleanupOutcomeToString(
        engine_.cleanup(arg<domain::PrincipalId>(req, "caller")));
  };

  // --- Claims ---------------------------------------------------------------
  handlers_["withdraw"] = [this](const nlohmann::json& req, nlohmann::json&) {
    engine_.withdraw(arg<domain::PrincipalId>(req, "caller"),
                     arg<domain::AssetId>(req, "asset"),
                     arg<domain::Amount>(req, "amount"));
  };

  handlers_["withdraw_all"] = [this](const nlohmann::json& req,
                                     nlohmann::json& reply) {
    const auto caller = arg<domain::PrincipalId>(req, "caller");
    const auto max_assets = argOr<std::size_t>(
        req, "max_assets", engine_.limits().default_withdraw_batch);
    reply["withdrawn"] = engine_.withdrawAllClaims(caller, max_assets);
  };

  // --- Administration -------------------------------------------------------
  handlers_["update_fee_config"] = [this](const nlohmann::json& req,
                                          nlohmann::json&) {
    engine_.updateFeeConfig(arg<domain::PrincipalId>(req, "caller"),
                            arg<domain::AssetId>(req, "fee_asset"),
                            arg<domain::Amount>(req, "fee_amount"));
  };

  handlers_["disable"] = [this](const nlohmann::json& req, nlohmann::json&) {
    engine_.disableCreation(arg<domain::PrincipalId>(req, "caller"));
  };

  handlers_["enable"] = [this](const nlohmann::json& req, nlohmann::json&) {
    engine_.enableCreation(arg<domain::PrincipalId>(req, "caller"));
  };

  handlers_["update_allowlist"] = [this](const nlohmann::json& req,
                                         nlohmann::json& reply) {
    reply["changed"] = engine_.updateAllowlist(
        arg<domain::PrincipalId>(req, "caller"),
        arg<std::vector<domain::AssetId>>(req, "assets"),
        arg<std::vector<bool>>(req, "allowed"));
  };

  // --- Reads ----------------------------------------------------------------
  handlers_["get_order"] = [this](const nlohmann::json& req,
                                  nlohmann::json& reply) {
    const auto id = arg<domain::OrderId>(req, "order_id");
    const auto order = engine_.order(id);
    if (!order.has_value()) {
      reply["order"] = nullptr;
      reply["tombstone"] = engine_.isTombstone(id);
      return;
    }
    reply["order"] = orderToJson(*order);
    reply["tombstone"] = false;
  };

  handlers_["active_orders"] = [this](const nlohmann::json& req,
                                      nlohmann::json& reply) {
    const auto page = engine_.activeOrders(
        argOr<domain::OrderId>(req, "offset", 0),
        argOr<std::size_t>(req, "limit", kDefaultPageSize));
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : page.orders) {
      orders.push_back(orderToJson(order));
    }
    reply["orders"] = std::move(orders);
    reply["next_offset"] = page.next_offset;
  };

  handlers_["allowlist"] = [this](const nlohmann::json&,
                                  nlohmann::json& reply) {
    reply["assets"] = engine_.allowedAssets();
  };

  handlers_["claimable"] = [this](const nlohmann::json& req,
                                  nlohmann::json& reply) {
    reply["amount"] = engine_.claimable(arg<domain::PrincipalId>(req, "principal"),
                                        arg<domain::AssetId>(req, "asset"));
  };

  handlers_["claimable_assets"] = [this](const nlohmann::json& req,
                                         nlohmann::json& reply) {
    reply["assets"] =
        engine_.claimableAssets(arg<domain::PrincipalId>(req, "principal"));
  };

  handlers_["fee_liability"] = [this](const nlohmann::json& req,
                                      nlohmann::json& reply) {
    reply["amount"] = engine_.feeLiability(arg<domain::AssetId>(req, "asset"));
  };
}

}  // namespace escrow
