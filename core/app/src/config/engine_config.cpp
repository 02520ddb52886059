#include "escrow/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace escrow {

namespace {

// nlohmann converts a negative integer to an unsigned target without
// complaint; unsigned fields must hold a non-negative JSON integer.
template <typename T>
T get(const nlohmann::json& value, const char* key) {
  if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
    const bool non_negative =
        value.is_number_unsigned() ||
        (value.is_number_integer() && value.get<std::int64_t>() >= 0);
    if (!non_negative) {
      throw ConfigError(std::string("key '") + key +
                        "' must be a non-negative integer");
    }
  }
  return value.get<T>();
}

template <typename T>
T required(const nlohmann::json& json, const char* key) {
  if (!json.contains(key)) {
    throw ConfigError(std::string("missing required key '") + key + "'");
  }
  return get<T>(json.at(key), key);
}

template <typename T>
T valueOr(const nlohmann::json& json, const char* key, T fallback) {
  if (!json.contains(key)) {
    return fallback;
  }
  return get<T>(json.at(key), key);
}

}  // namespace

// -----------------------------------------------------------------------------
// validate(): the constraints SwapEngine assumes
// -----------------------------------------------------------------------------
void EngineConfig::validate() const {
  if (domain::isNull(owner)) {
    throw ConfigError("owner must not be empty");
  }
  if (domain::isNull(custody)) {
    throw ConfigError("custody must not be empty");
  }
  if (domain::isNull(fee.asset)) {
    throw ConfigError("fee.asset must not be empty");
  }
  if (fee.amount == 0) {
    throw ConfigError("fee.amount must be positive");
  }
  if (allowed_assets.empty()) {
    throw ConfigError("allowed_assets must not be empty");
  }
  if (limits.order_expiry_ms <= 0 || limits.grace_period_ms < 0) {
    throw ConfigError("limits: expiry must be positive, grace non-negative");
  }
  if (limits.grace_period_ms >
      std::numeric_limits<domain::TimestampMs>::max() -
          limits.order_expiry_ms) {
    throw ConfigError("limits: expiry + grace overflows a timestamp");
  }
  if (limits.max_allowlist_batch == 0 || limits.default_withdraw_batch == 0) {
    throw ConfigError("limits: batch caps must be positive");
  }
  for (const auto& asset : allowed_assets) {
    if (domain::isNull(asset)) {
      throw ConfigError("allowed_assets: asset ids must not be empty");
    }
  }
  for (const auto& seed : seed_balances) {
    if (domain::isNull(seed.asset) || domain::isNull(seed.principal)) {
      throw ConfigError("seed_balances: asset and principal are required");
    }
  }
}

// -----------------------------------------------------------------------------
// parseEngineConfig(json)
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& json) {
  EngineConfig config;
  try {
    config.owner = required<std::string>(json, "owner");
    config.custody = required<std::string>(json, "custody");

    const auto& fee = json.at("fee");
    config.fee.asset = required<std::string>(fee, "asset");
    config.fee.amount = required<domain::Amount>(fee, "amount");

    config.allowed_assets =
        required<std::vector<std::string>>(json, "allowed_assets");

    if (json.contains("limits")) {
      const auto& limits = json.at("limits");
      auto& out = config.limits;
      out.order_expiry_ms =
          valueOr(limits, "order_expiry_ms", out.order_expiry_ms);
      out.grace_period_ms =
          valueOr(limits, "grace_period_ms", out.grace_period_ms);
      out.max_allowlist_batch =
          valueOr(limits, "max_allowlist_batch", out.max_allowlist_batch);
      out.default_withdraw_batch = valueOr(
          limits, "default_withdraw_batch", out.default_withdraw_batch);
    }

    if (json.contains("ipc")) {
      const auto& ipc = json.at("ipc");
      config.command_endpoint =
          valueOr(ipc, "command_endpoint", config.command_endpoint);
      config.telemetry_endpoint =
          valueOr(ipc, "telemetry_endpoint", config.telemetry_endpoint);
    }

    if (json.contains("seed_balances")) {
      for (const auto& entry : json.at("seed_balances")) {
        SeedBalance seed;
        seed.asset = required<std::string>(entry, "asset");
        seed.principal = required<std::string>(entry, "principal");
        seed.amount = required<domain::Amount>(entry, "amount");
        seed.approve_custody = valueOr(entry, "approve_custody", true);
        config.seed_balances.push_back(std::move(seed));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid engine config: ") + e.what());
  }

  config.validate();
  return config;
}

EngineConfig parseEngineConfigText(const std::string& text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("engine config is not valid JSON: ") +
                      e.what());
  }
  return parseEngineConfig(json);
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open engine config '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfigText(buffer.str());
}

// -----------------------------------------------------------------------------
// toJson(): inverse of parseEngineConfig
// -----------------------------------------------------------------------------
nlohmann::json toJson(const EngineConfig& config) {
  nlohmann::json j;
  j["owner"] = config.owner;
  j["custody"] = config.custody;
  j["fee"] = {{"asset", config.fee.asset}, {"amount", config.fee.amount}};
  j["allowed_assets"] = config.allowed_assets;
  j["limits"] = {
      {"order_expiry_ms", config.limits.order_expiry_ms},
      {"grace_period_ms", config.limits.grace_period_ms},
      {"max_allowlist_batch", config.limits.max_allowlist_batch},
      {"default_withdraw_batch", config.limits.default_withdraw_batch},
  };
  j["ipc"] = {{"command_endpoint", config.command_endpoint},
              {"telemetry_endpoint", config.telemetry_endpoint}};

  nlohmann::json seeds = nlohmann::json::array();
  for (const auto& seed : config.seed_balances) {
    seeds.push_back({{"asset", seed.asset},
                     {"principal", seed.principal},
                     {"amount", seed.amount},
                     {"approve_custody", seed.approve_custody}});
  }
  j["seed_balances"] = std::move(seeds);
  return j;
}

}  // namespace escrow
