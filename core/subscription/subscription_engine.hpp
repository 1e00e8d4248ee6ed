/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ledgersync::subscription {

  template <typename Key, typename Receiver, typename... Arguments>
  class Subscriber;

  using SubscriptionSetId = uint32_t;

  /**
   * Dispatches notifications published under a key to every subscriber of
   * that key. Subscribers are held weakly; callbacks run outside of the
   * engine lock.
   * @tparam Key subscription key, must be hashable
   * @tparam Receiver object owned by each subscriber
   * @tparam EventParams notification arguments
   */
  template <typename Key, typename Receiver, typename... EventParams>
  class SubscriptionEngine final
      : public std::enable_shared_from_this<
            SubscriptionEngine<Key, Receiver, EventParams...>> {
   public:
    using KeyType = Key;
    using ReceiverType = Receiver;
    using SubscriptionSetId = subscription::SubscriptionSetId;
    using SubscriberType = Subscriber<KeyType, ReceiverType, EventParams...>;
    using SubscriberPtr = std::shared_ptr<SubscriberType>;
    using SubscriberWeakPtr = std::weak_ptr<SubscriberType>;

    /// List iterators remain valid after removal of other elements
    using SubscribersContainer =
        std::list<std::pair<SubscriptionSetId, SubscriberWeakPtr>>;
    using IteratorType = typename SubscribersContainer::iterator;

    SubscriptionEngine() = default;
    ~SubscriptionEngine() = default;

    SubscriptionEngine(const SubscriptionEngine &) = delete;
    SubscriptionEngine &operator=(const SubscriptionEngine &) = delete;

    SubscriptionEngine(SubscriptionEngine &&) = delete;
    SubscriptionEngine &operator=(SubscriptionEngine &&) = delete;

    size_t size(const KeyType &key) const {
      std::shared_lock lock(subscribers_map_cs_);
      if (auto it = subscribers_map_.find(key); it != subscribers_map_.end()) {
        return it->second.size();
      }
      return 0ull;
    }

    size_t size() const {
      std::shared_lock lock(subscribers_map_cs_);
      size_t count = 0ull;
      for (auto &[_, subscribers] : subscribers_map_) {
        count += subscribers.size();
      }
      return count;
    }

    void notify(const KeyType &key, const EventParams &...args) {
      std::vector<std::pair<SubscriptionSetId, SubscriberPtr>> receivers;
      {
        std::shared_lock lock(subscribers_map_cs_);
        auto it = subscribers_map_.find(key);
        if (subscribers_map_.end() == it) {
          return;
        }
        receivers.reserve(it->second.size());
        // expired entries are removed by the destructor of their subscriber
        for (auto &[set_id, weak_sub] : it->second) {
          if (auto sub = weak_sub.lock()) {
            receivers.emplace_back(set_id, std::move(sub));
          }
        }
      }

      for (auto &[set_id, sub] : receivers) {
        sub->onNotify(set_id, key, args...);
      }
    }

   private:
    template <typename K, typename R, typename... Args>
    friend class Subscriber;

    IteratorType subscribe(SubscriptionSetId set_id,
                           const KeyType &key,
                           SubscriberWeakPtr ptr) {
      std::unique_lock lock(subscribers_map_cs_);
      auto &subscribers = subscribers_map_[key];
      return subscribers.emplace(subscribers.end(),
                                 std::make_pair(set_id, std::move(ptr)));
    }

    void unsubscribe(const KeyType &key, const IteratorType &it_remove) {
      std::unique_lock lock(subscribers_map_cs_);
      auto it = subscribers_map_.find(key);
      if (subscribers_map_.end() != it) {
        it->second.erase(it_remove);
        if (it->second.empty()) {
          subscribers_map_.erase(it);
        }
      }
    }

    mutable std::shared_mutex subscribers_map_cs_;
    std::unordered_map<KeyType, SubscribersContainer> subscribers_map_;
  };

}  // namespace ledgersync::subscription
