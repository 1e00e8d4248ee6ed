/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace ledgersync {

  // clang-format off
  /**
   * Protected object wrapper. Allow read-write access.
   * @tparam T object type
   * @tparam M mutex type
   * Example:
   * @code
   *  SafeObject<std::vector<int>> obj;
   *  obj.exclusiveAccess([](auto &v) {
   *      v.push_back(1);
   *  });
   *  auto const size =
   *      obj.sharedAccess([](auto const &v) {
   *          return v.size();
   *      });
   * @endcode
   */
  // clang-format on
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    T &unsafeGet() {
      return t_;
    }

    const T &unsafeGet() const {
      return t_;
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace ledgersync
