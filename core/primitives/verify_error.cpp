/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/verify_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ledgersync::primitives, VerifyError, e) {
  using E = ledgersync::primitives::VerifyError;
  switch (e) {
    case E::UNKNOWN_AUTHOR:
      return "Signature author is not a member of the validator set";
    case E::TOO_LITTLE_VOTING_POWER:
      return "Signers do not hold enough voting power to form a quorum";
    case E::INVALID_SIGNATURE:
      return "Signature verification failed";
    case E::INCONSISTENT_EPOCH:
      return "Ledger info epoch differs from the epoch of the validator set";
    case E::ENCODING_FAILED:
      return "Can't encode ledger info to produce the signing message";
  }
  return "Unknown VerifyError";
}
