#include "escrow/network/json_format.hpp"
#include "escrow/time/time_utils.hpp"

#include <type_traits>

namespace escrow {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

nlohmann::json envelope(const char* type, Timestamp timestamp,
                        std::uint64_t sequence_id) {
  nlohmann::json j;
  j["type"] = type;
  j["sequence_id"] = sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(timestamp);
  return j;
}

}  // namespace

nlohmann::json orderToJson(const domain::Order& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["maker"] = order.maker;
  j["counterparty"] = order.counterparty.has_value()
                          ? nlohmann::json(*order.counterparty)
                          : nlohmann::json(nullptr);
  j["sell_asset"] = order.sell_asset;
  j["sell_amount"] = order.sell_amount;
  j["buy_asset"] = order.buy_asset;
  j["buy_amount"] = order.buy_amount;
  j["created_at_ms"] = order.created_at_ms;
  j["status"] = domain::orderStatusToString(order.status);
  j["fee_asset"] = order.fee.asset;
  j["fee_amount"] = order.fee.amount;
  return j;
}

const char* notificationType(const Notification& notification) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OrderCreatedEvent>) {
          return "order_created";
        } else if constexpr (std::is_same_v<T, OrderFilledEvent>) {
          return "order_filled";
        } else if constexpr (std::is_same_v<T, OrderCanceledEvent>) {
          return "order_canceled";
        } else if constexpr (std::is_same_v<T, OrderCleanedUpEvent>) {
          return "order_cleaned_up";
        } else if constexpr (std::is_same_v<T, FeeConfigUpdatedEvent>) {
          return "fee_config_updated";
        } else if constexpr (std::is_same_v<T, AllowlistUpdatedEvent>) {
          return "allowlist_updated";
        } else if constexpr (std::is_same_v<T, CreationSwitchChangedEvent>) {
          return "creation_switch_changed";
        } else if constexpr (std::is_same_v<T, ClaimCreditedEvent>) {
          return "claim_credited";
        } else if constexpr (std::is_same_v<T, ClaimWithdrawnEvent>) {
          return "claim_withdrawn";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled notification type");
        }
      },
      notification);
}

// -----------------------------------------------------------------------------
// notificationToJson(): per-type field sets on a common envelope
// -----------------------------------------------------------------------------
nlohmann::json notificationToJson(const Notification& notification) {
  return std::visit(
      [&notification](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j =
            envelope(notificationType(notification), e.timestamp,
                     e.sequence_id);

        if constexpr (std::is_same_v<T, OrderCreatedEvent>) {
          j["order"] = orderToJson(e.order);
        } else if constexpr (std::is_same_v<T, OrderFilledEvent>) {
          j["order_id"] = e.order_id;
          j["maker"] = e.maker;
          j["taker"] = e.taker;
          j["sell_asset"] = e.sell_asset;
          j["sell_amount"] = e.sell_amount;
          j["buy_asset"] = e.buy_asset;
          j["buy_amount"] = e.buy_amount;
        } else if constexpr (std::is_same_v<T, OrderCanceledEvent>) {
          j["order_id"] = e.order_id;
          j["maker"] = e.maker;
          j["sell_asset"] = e.sell_asset;
          j["sell_amount"] = e.sell_amount;
        } else if constexpr (std::is_same_v<T, OrderCleanedUpEvent>) {
          j["order_id"] = e.order_id;
          j["caller"] = e.caller;
          j["previous_status"] =
              domain::orderStatusToString(e.previous_status);
          j["fee_asset"] = e.fee_asset;
          j["fee_amount"] = e.fee_amount;
        } else if constexpr (std::is_same_v<T, FeeConfigUpdatedEvent>) {
          j["fee_asset"] = e.fee_asset;
          j["fee_amount"] = e.fee_amount;
        } else if constexpr (std::is_same_v<T, AllowlistUpdatedEvent>) {
          j["asset"] = e.asset;
          j["allowed"] = e.allowed;
        } else if constexpr (std::is_same_v<T, CreationSwitchChangedEvent>) {
          j["disabled"] = e.disabled;
        } else if constexpr (std::is_same_v<T, ClaimCreditedEvent>) {
          j["principal"] = e.principal;
          j["asset"] = e.asset;
          j["amount"] = e.amount;
          j["reason"] = creditReasonToString(e.reason);
          j["order_id"] = e.order_id.has_value() ? nlohmann::json(*e.order_id)
                                                 : nlohmann::json(nullptr);
        } else if constexpr (std::is_same_v<T, ClaimWithdrawnEvent>) {
          j["principal"] = e.principal;
          j["asset"] = e.asset;
          j["amount"] = e.amount;
        }
        return j;
      },
      notification);
}

}  // namespace escrow
