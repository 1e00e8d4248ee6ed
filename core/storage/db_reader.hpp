/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>

#include "outcome/outcome.hpp"
#include "primitives/epoch_state.hpp"
#include "primitives/ledger_info.hpp"
#include "primitives/transaction.hpp"

namespace ledgersync::storage {

  /**
   * @struct StartupInfo is the latest committed ledger info together with
   * the epoch state it must be verified with
   */
  struct StartupInfo {
    primitives::LedgerInfoWithSignatures latest_ledger_info;
    /// May be absent when the latest ledger info itself ends an epoch
    std::optional<primitives::EpochState> latest_epoch_state;

    /**
     * @return next epoch state carried by the latest ledger info if it ends
     * an epoch, otherwise the latest epoch state
     */
    std::optional<primitives::EpochState> epochState() const {
      if (const auto &next = latest_ledger_info.ledger_info.next_epoch_state;
          next.has_value()) {
        return next;
      }
      return latest_epoch_state;
    }
  };

  /**
   * Read-only access to the committed ledger
   */
  class DbReader {
   public:
    virtual ~DbReader() = default;

    /// @return none if nothing, not even genesis, is committed
    virtual outcome::result<std::optional<StartupInfo>> getStartupInfo()
        const = 0;

    /// @return version and info of the latest committed transaction
    virtual outcome::result<
        std::optional<std::pair<primitives::Version,
                                primitives::TransactionInfo>>>
    getLatestTransactionInfoOption() const = 0;
  };

}  // namespace ledgersync::storage
