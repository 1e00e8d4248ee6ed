/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace ledgersync::mempool {

  /// User transaction removed from the mempool once committed
  struct CommittedTransaction {
    primitives::AccountAddress sender{};
    uint64_t sequence_number{};

    bool operator==(const CommittedTransaction &) const = default;
  };

  /**
   * Informs mempool about transactions committed by state sync
   */
  class MempoolNotificationSender {
   public:
    virtual ~MempoolNotificationSender() = default;

    virtual outcome::result<void> notifyNewCommits(
        std::vector<CommittedTransaction> committed_transactions,
        uint64_t block_timestamp_usecs) = 0;
  };

}  // namespace ledgersync::mempool
