#pragma once

#include "escrow/domain/order.hpp"
#include "escrow/events/notification.hpp"

#include <nlohmann/json.hpp>

namespace escrow {

// -----------------------------------------------------------------------------
// JSON formatting for the IPC surface
// -----------------------------------------------------------------------------
// Shared by IpcServer (telemetry on the PUB socket) and CommandRouter (reply
// payloads). Amounts and ids are JSON unsigned integers, timestamps are epoch
// milliseconds, enums are the lowercase / Capitalised strings from their
// *ToString() helpers.
// -----------------------------------------------------------------------------

nlohmann::json orderToJson(const domain::Order& order);

// {"type": "<kind>", "sequence_id": n, "timestamp_ms": t, ...fields}
nlohmann::json notificationToJson(const Notification& notification);

// Short type tag, e.g. "order_created", "claim_credited".
const char* notificationType(const Notification& notification);

}  // namespace escrow
