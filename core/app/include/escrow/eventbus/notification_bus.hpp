#pragma once

#include "escrow/events/notification.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// NotificationBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for committed engine
// notifications. SwapEngine publishes; the logger, the IPC bridge and tests
// subscribe.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread. SwapEngine publishes
// after it has left its CallGate, so a callback may call engine operations.
// -----------------------------------------------------------------------------
class NotificationBus {
 public:
  using GenericCallback = std::function<void(const Notification&)>;
  using SubscriptionId = std::size_t;

  NotificationBus() = default;

  NotificationBus(const NotificationBus&) = delete;
  NotificationBus& operator=(const NotificationBus&) = delete;

  // Callback receives every notification.
  SubscriptionId subscribe(GenericCallback callback);

  // Callback receives only notifications holding NotificationType.
  template <typename NotificationType>
  SubscriptionId subscribe(
      std::function<void(const NotificationType&)> callback);

  // Unknown ids are ignored. A publish already in progress may still deliver
  // its current notification to the removed callback.
  void unsubscribe(SubscriptionId id);

  // Delivers to a copy of the subscriber list taken under the lock, so a
  // callback may subscribe, unsubscribe or publish without deadlocking.
  void publish(const Notification& notification);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename NotificationType>
NotificationBus::SubscriptionId NotificationBus::subscribe(
    std::function<void(const NotificationType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](
                                const Notification& notification) {
    if (const auto* ptr = std::get_if<NotificationType>(&notification)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace escrow
