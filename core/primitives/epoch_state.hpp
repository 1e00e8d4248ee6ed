/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "crypto/signature_verifier.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "primitives/validator_verifier.hpp"

namespace ledgersync::primitives {

  struct LedgerInfoWithSignatures;

  /**
   * @struct EpochState is the validator set trusted during one epoch
   */
  struct EpochState {
    SCALE_TIE(2);

    Epoch epoch{};
    ValidatorVerifier verifier;

    bool operator==(const EpochState &) const = default;

    /**
     * Checks that {@param ledger_info} belongs to this epoch and is signed
     * by a quorum of its validators
     */
    outcome::result<void> verify(
        const LedgerInfoWithSignatures &ledger_info,
        const crypto::SignatureVerifier &signature_verifier) const;
  };

}  // namespace ledgersync::primitives
