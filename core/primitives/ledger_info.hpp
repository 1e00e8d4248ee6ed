/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <scale/scale.hpp>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "primitives/epoch_state.hpp"
#include "primitives/validator_verifier.hpp"

namespace ledgersync::primitives {

  /**
   * @struct LedgerInfo summarizes the state of the ledger at a version of a
   * committed block
   */
  struct LedgerInfo {
    SCALE_TIE(8);

    Epoch epoch{};
    Round round{};
    HashValue block_id{};
    HashValue executed_state_id{};
    Version version{};
    uint64_t timestamp_usecs{};
    /// Validator set of the next epoch, present in the last block of epoch
    std::optional<EpochState> next_epoch_state;
    HashValue consensus_data_hash{};

    bool operator==(const LedgerInfo &) const = default;

    bool endsEpoch() const {
      return next_epoch_state.has_value();
    }
  };

  /// Validators sign SCALE encoded ledger info
  outcome::result<std::vector<uint8_t>> signingMessage(
      const LedgerInfo &ledger_info);

  struct LedgerInfoWithSignatures {
    LedgerInfo ledger_info;
    AggregateSignature signatures;

    bool operator==(const LedgerInfoWithSignatures &) const = default;
  };

}  // namespace ledgersync::primitives
