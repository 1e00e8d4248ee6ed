/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/ledger_info.hpp"

#include "primitives/verify_error.hpp"

namespace ledgersync::primitives {

  outcome::result<std::vector<uint8_t>> signingMessage(
      const LedgerInfo &ledger_info) {
    auto encoded = scale::encode(ledger_info);
    if (not encoded) {
      return VerifyError::ENCODING_FAILED;
    }
    return std::move(encoded.value());
  }

}  // namespace ledgersync::primitives
