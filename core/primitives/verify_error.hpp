/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace ledgersync::primitives {

  enum class VerifyError {
    /// Signer is not a member of the validator set
    UNKNOWN_AUTHOR = 1,
    /// Signers do not reach the quorum voting power
    TOO_LITTLE_VOTING_POWER,
    /// At least one signature does not match its signer
    INVALID_SIGNATURE,
    /// Ledger info belongs to another epoch than the validator set
    INCONSISTENT_EPOCH,
    /// Signing message can not be produced
    ENCODING_FAILED,
  };

}  // namespace ledgersync::primitives

OUTCOME_HPP_DECLARE_ERROR(ledgersync::primitives, VerifyError);
