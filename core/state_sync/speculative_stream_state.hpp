/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "crypto/signature_verifier.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/epoch_state.hpp"
#include "primitives/ledger_info.hpp"

namespace ledgersync::state_sync {

  /**
   * Trust state of one data stream: the validator set all received data is
   * verified with, the latest ledger info the data must prove against and
   * the version synced so far.
   */
  class SpeculativeStreamState {
   public:
    SpeculativeStreamState(
        primitives::EpochState epoch_state,
        std::optional<primitives::LedgerInfoWithSignatures> proof_ledger_info,
        primitives::Version synced_version,
        std::shared_ptr<crypto::SignatureVerifier> signature_verifier);

    const primitives::EpochState &epochState() const {
      return epoch_state_;
    }

    /**
     * @return version following the synced one, INTEGER_OVERFLOW if the
     * synced version is the maximum one
     */
    outcome::result<primitives::Version> expectedNextVersion() const;

    bool hasProofLedgerInfo() const {
      return proof_ledger_info_.has_value();
    }

    /**
     * Must not be called before a ledger info is verified
     */
    const primitives::LedgerInfoWithSignatures &getProofLedgerInfo() const;

    primitives::Version syncedVersion() const {
      return synced_version_;
    }

    /// Callers are responsible for never moving the version backwards
    void updateSyncedVersion(primitives::Version synced_version);

    /**
     * Verifies {@param ledger_info} with the trusted epoch state and makes it
     * the new proof ledger info. Rolls the epoch state over if the ledger
     * info ends the epoch. Verifying the current proof ledger info again
     * changes nothing.
     * @return VERIFICATION_ERROR if the ledger info is not certified by a
     * quorum of the trusted validators
     */
    outcome::result<void> verifyLedgerInfoWithSignatures(
        const primitives::LedgerInfoWithSignatures &ledger_info);

   private:
    primitives::EpochState epoch_state_;
    std::optional<primitives::LedgerInfoWithSignatures> proof_ledger_info_;
    primitives::Version synced_version_;
    std::shared_ptr<crypto::SignatureVerifier> signature_verifier_;
    log::Logger logger_;
  };

}  // namespace ledgersync::state_sync
