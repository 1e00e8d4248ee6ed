/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "events/event_subscription_service.hpp"

#include <functional>
#include <memory>
#include <optional>

#include "log/logger.hpp"
#include "subscription/subscriber.hpp"
#include "subscription/subscription_engine.hpp"
#include "utils/safe_object.hpp"

namespace ledgersync::events {

  using EventCallback =
      std::function<void(primitives::Version,
                         const std::vector<primitives::ContractEvent> &)>;

  using EventSubscriptionEngine =
      subscription::SubscriptionEngine<primitives::EventKey,
                                       EventCallback,
                                       primitives::Version,
                                       std::vector<primitives::ContractEvent>>;
  using EventSubscriptionEnginePtr = std::shared_ptr<EventSubscriptionEngine>;

  using EventSubscriber =
      subscription::Subscriber<primitives::EventKey,
                               EventCallback,
                               primitives::Version,
                               std::vector<primitives::ContractEvent>>;
  using EventSubscriberPtr = std::shared_ptr<EventSubscriber>;

  /**
   * In-process event fan-out. Each subscriber receives, per notified
   * version, the events of every key it is subscribed to, grouped by key.
   * Subscription lasts while the returned subscriber is alive.
   * Callbacks are invoked under the notification lock and must not call
   * `notifyEvents`.
   */
  class EventSubscriptionServiceImpl : public EventSubscriptionService {
   public:
    EventSubscriptionServiceImpl();

    EventSubscriberPtr subscribeToEvents(
        const std::vector<primitives::EventKey> &event_keys,
        EventCallback callback);

    /// Subscribes to the events announcing a new epoch
    EventSubscriberPtr subscribeToReconfigurations(EventCallback callback);

    outcome::result<void> notifyEvents(
        primitives::Version version,
        const std::vector<primitives::ContractEvent> &events) override;

    std::optional<primitives::Version> lastNotifiedVersion() const;

   private:
    EventSubscriptionEnginePtr engine_;
    SafeObject<std::optional<primitives::Version>> last_notified_version_;
    log::Logger logger_;
  };

}  // namespace ledgersync::events
