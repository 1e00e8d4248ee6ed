/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "subscription/subscription_engine.hpp"

namespace ledgersync::subscription {

  /**
   * Subscription handle of a SubscriptionEngine. Keys are grouped into sets
   * which may be unsubscribed at once. Everything is unsubscribed on
   * destruction.
   * @tparam Key is a type of a subscription key
   * @tparam Type is a type of an object passed to the callback
   * @tparam Arguments are notification arguments
   */
  template <typename Key, typename Type, typename... Arguments>
  class Subscriber final : public std::enable_shared_from_this<
                               Subscriber<Key, Type, Arguments...>> {
   public:
    using KeyType = Key;
    using ValueType = Type;

    using SubscriptionEngineType =
        SubscriptionEngine<KeyType, ValueType, Arguments...>;
    using SubscriptionEnginePtr = std::shared_ptr<SubscriptionEngineType>;
    using SubscriptionSetId =
        typename SubscriptionEngineType::SubscriptionSetId;

    using CallbackFnType = std::function<void(
        SubscriptionSetId, ValueType &, const KeyType &, const Arguments &...)>;

    template <typename... Args>
    explicit Subscriber(SubscriptionEnginePtr engine, Args &&...args)
        : next_id_(0u),
          engine_(std::move(engine)),
          object_(std::forward<Args>(args)...) {}

    ~Subscriber() {
      for (auto &[_, subscriptions] : subscriptions_sets_) {
        for (auto &[key, it] : subscriptions) {
          engine_->unsubscribe(key, it);
        }
      }
    }

    Subscriber(const Subscriber &) = delete;
    Subscriber &operator=(const Subscriber &) = delete;

    Subscriber(Subscriber &&) = delete;
    Subscriber &operator=(Subscriber &&) = delete;

    void setCallback(CallbackFnType &&f) {
      on_notify_callback_ = std::move(f);
    }

    SubscriptionSetId generateSubscriptionSetId() {
      return ++next_id_;
    }

    void subscribe(SubscriptionSetId id, const KeyType &key) {
      std::lock_guard lock(subscriptions_cs_);
      auto &&[it, inserted] = subscriptions_sets_[id].emplace(
          key, typename SubscriptionEngineType::IteratorType{});
      if (inserted) {
        it->second = engine_->subscribe(id, key, this->weak_from_this());
      }
    }

    void unsubscribe(SubscriptionSetId id, const KeyType &key) {
      std::lock_guard lock(subscriptions_cs_);
      if (auto set_it = subscriptions_sets_.find(id);
          set_it != subscriptions_sets_.end()) {
        auto &subscriptions = set_it->second;
        if (auto it = subscriptions.find(key); subscriptions.end() != it) {
          engine_->unsubscribe(key, it->second);
          subscriptions.erase(it);
        }
      }
    }

    void unsubscribe(SubscriptionSetId id) {
      std::lock_guard lock(subscriptions_cs_);
      if (auto set_it = subscriptions_sets_.find(id);
          set_it != subscriptions_sets_.end()) {
        for (auto &[key, it] : set_it->second) {
          engine_->unsubscribe(key, it);
        }
        subscriptions_sets_.erase(set_it);
      }
    }

    void unsubscribe() {
      std::lock_guard lock(subscriptions_cs_);
      for (auto &[_, subscriptions] : subscriptions_sets_) {
        for (auto &[key, it] : subscriptions) {
          engine_->unsubscribe(key, it);
        }
      }
      subscriptions_sets_.clear();
    }

    void onNotify(SubscriptionSetId set_id,
                  const KeyType &key,
                  const Arguments &...args) {
      if (nullptr != on_notify_callback_) {
        on_notify_callback_(set_id, object_, key, args...);
      }
    }

   private:
    using SubscriptionsContainer =
        std::unordered_map<KeyType,
                           typename SubscriptionEngineType::IteratorType>;
    using SubscriptionsSets =
        std::unordered_map<SubscriptionSetId, SubscriptionsContainer>;

    std::atomic<SubscriptionSetId> next_id_;
    SubscriptionEnginePtr engine_;
    ValueType object_;

    std::mutex subscriptions_cs_;
    SubscriptionsSets subscriptions_sets_;

    CallbackFnType on_notify_callback_;
  };

}  // namespace ledgersync::subscription
