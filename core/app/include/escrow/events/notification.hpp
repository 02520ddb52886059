#pragma once

#include "escrow/events/notification_types.hpp"

#include <variant>

namespace escrow {

// -----------------------------------------------------------------------------
// Notification
// -----------------------------------------------------------------------------
// Envelope for everything the engine emits. One NotificationBus carries every
// kind; subscribers pick the ones they need with subscribe<T>() or
// std::visit.
// -----------------------------------------------------------------------------
using Notification = std::variant<
    OrderCreatedEvent,
    OrderFilledEvent,
    OrderCanceledEvent,
    OrderCleanedUpEvent,
    FeeConfigUpdatedEvent,
    AllowlistUpdatedEvent,
    CreationSwitchChangedEvent,
    ClaimCreditedEvent,
    ClaimWithdrawnEvent>;

}  // namespace escrow
