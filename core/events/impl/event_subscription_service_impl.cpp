/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "events/impl/event_subscription_service_impl.hpp"

#include <map>

#include "events/event_notification_error.hpp"

namespace ledgersync::events {

  EventSubscriptionServiceImpl::EventSubscriptionServiceImpl()
      : engine_{std::make_shared<EventSubscriptionEngine>()},
        logger_{log::createLogger("EventSubscriptionService", "events")} {}

  EventSubscriberPtr EventSubscriptionServiceImpl::subscribeToEvents(
      const std::vector<primitives::EventKey> &event_keys,
      EventCallback callback) {
    auto subscriber =
        std::make_shared<EventSubscriber>(engine_, std::move(callback));
    subscriber->setCallback([](subscription::SubscriptionSetId,
                               EventCallback &receiver,
                               const primitives::EventKey &,
                               const primitives::Version &version,
                               const std::vector<primitives::ContractEvent>
                                   &events) { receiver(version, events); });
    auto set_id = subscriber->generateSubscriptionSetId();
    for (auto &key : event_keys) {
      subscriber->subscribe(set_id, key);
    }
    SL_DEBUG(logger_, "New subscription to {} event keys", event_keys.size());
    return subscriber;
  }

  EventSubscriberPtr EventSubscriptionServiceImpl::subscribeToReconfigurations(
      EventCallback callback) {
    return subscribeToEvents({primitives::kNewEpochEventKey},
                             std::move(callback));
  }

  outcome::result<void> EventSubscriptionServiceImpl::notifyEvents(
      primitives::Version version,
      const std::vector<primitives::ContractEvent> &events) {
    return last_notified_version_.exclusiveAccess(
        [&](std::optional<primitives::Version> &last_version)
            -> outcome::result<void> {
          if (last_version and version <= *last_version) {
            SL_WARN(logger_,
                    "Events of version {} arrived after version {}",
                    version,
                    *last_version);
            return EventNotificationError::VERSION_NOT_INCREASING;
          }
          last_version = version;

          std::map<primitives::EventKey, std::vector<primitives::ContractEvent>>
              events_by_key;
          for (auto &event : events) {
            events_by_key[event.key].push_back(event);
          }
          for (auto &[key, key_events] : events_by_key) {
            engine_->notify(key, version, key_events);
          }
          SL_TRACE(logger_,
                   "Notified {} events of version {}",
                   events.size(),
                   version);
          return outcome::success();
        });
  }

  std::optional<primitives::Version>
  EventSubscriptionServiceImpl::lastNotifiedVersion() const {
    return last_notified_version_.sharedAccess(
        [](const auto &last_version) { return last_version; });
  }

}  // namespace ledgersync::events
