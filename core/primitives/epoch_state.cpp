/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/epoch_state.hpp"

#include "primitives/ledger_info.hpp"
#include "primitives/verify_error.hpp"

namespace ledgersync::primitives {

  outcome::result<void> EpochState::verify(
      const LedgerInfoWithSignatures &ledger_info,
      const crypto::SignatureVerifier &signature_verifier) const {
    if (ledger_info.ledger_info.epoch != epoch) {
      return VerifyError::INCONSISTENT_EPOCH;
    }
    OUTCOME_TRY(message, signingMessage(ledger_info.ledger_info));
    return verifier.verifyMultiSignatures(
        message, ledger_info.signatures, signature_verifier);
  }

}  // namespace ledgersync::primitives
