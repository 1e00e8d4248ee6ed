/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/speculative_stream_state.hpp"

#include <limits>

#include <boost/assert.hpp>

#include "state_sync/state_sync_error.hpp"

namespace ledgersync::state_sync {

  SpeculativeStreamState::SpeculativeStreamState(
      primitives::EpochState epoch_state,
      std::optional<primitives::LedgerInfoWithSignatures> proof_ledger_info,
      primitives::Version synced_version,
      std::shared_ptr<crypto::SignatureVerifier> signature_verifier)
      : epoch_state_{std::move(epoch_state)},
        proof_ledger_info_{std::move(proof_ledger_info)},
        synced_version_{synced_version},
        signature_verifier_{std::move(signature_verifier)},
        logger_{log::createLogger("SpeculativeStreamState",
                                  "speculative_state")} {
    BOOST_ASSERT(signature_verifier_ != nullptr);
  }

  outcome::result<primitives::Version>
  SpeculativeStreamState::expectedNextVersion() const {
    if (synced_version_ == std::numeric_limits<primitives::Version>::max()) {
      SL_ERROR(logger_,
               "Synced version {} has no next version",
               synced_version_);
      return StateSyncError::INTEGER_OVERFLOW;
    }
    return synced_version_ + 1;
  }

  const primitives::LedgerInfoWithSignatures &
  SpeculativeStreamState::getProofLedgerInfo() const {
    BOOST_ASSERT_MSG(proof_ledger_info_.has_value(),
                     "Proof ledger info must be verified before use");
    return proof_ledger_info_.value();
  }

  void SpeculativeStreamState::updateSyncedVersion(
      primitives::Version synced_version) {
    synced_version_ = synced_version;
  }

  outcome::result<void> SpeculativeStreamState::verifyLedgerInfoWithSignatures(
      const primitives::LedgerInfoWithSignatures &ledger_info) {
    if (proof_ledger_info_ == ledger_info) {
      return outcome::success();
    }

    auto res = epoch_state_.verify(ledger_info, *signature_verifier_);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Ledger info of epoch {} at version {} failed verification "
              "with validators of epoch {}: {}",
              ledger_info.ledger_info.epoch,
              ledger_info.ledger_info.version,
              epoch_state_.epoch,
              res.error().message());
      return StateSyncError::VERIFICATION_ERROR;
    }

    proof_ledger_info_ = ledger_info;
    if (const auto &next_epoch_state = ledger_info.ledger_info.next_epoch_state;
        next_epoch_state.has_value()) {
      SL_INFO(logger_,
              "Epoch changed {} -> {} at version {}",
              epoch_state_.epoch,
              next_epoch_state->epoch,
              ledger_info.ledger_info.version);
      epoch_state_ = *next_epoch_state;
    }
    return outcome::success();
  }

}  // namespace ledgersync::state_sync
