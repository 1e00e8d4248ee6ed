/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "primitives/common.hpp"

namespace ledgersync::primitives {

  /**
   * @struct EventKey identifies an event stream of an account
   */
  struct EventKey {
    uint64_t creation_number{};
    AccountAddress account_address{};

    auto operator<=>(const EventKey &) const = default;
  };

  /// Key of the event emitted by the framework when a new epoch starts
  inline const EventKey kNewEpochEventKey{2, kCoreCodeAddress};

  struct ContractEvent {
    EventKey key;
    uint64_t sequence_number{};
    std::string type_tag;
    std::vector<uint8_t> event_data;

    bool operator==(const ContractEvent &) const = default;

    bool isNewEpochEvent() const {
      return key == kNewEpochEventKey;
    }
  };

}  // namespace ledgersync::primitives

template <>
struct std::hash<ledgersync::primitives::EventKey> {
  size_t operator()(const ledgersync::primitives::EventKey &x) const {
    size_t hash = 0;
    boost::hash_combine(hash, x.creation_number);
    boost::hash_range(
        hash, x.account_address.begin(), x.account_address.end());
    return hash;
  }
};
