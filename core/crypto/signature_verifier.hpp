/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>

#include "crypto/crypto_types.hpp"
#include "outcome/outcome.hpp"

namespace ledgersync::crypto {

  /**
   * Checks validator signatures over ledger infos
   */
  class SignatureVerifier {
   public:
    virtual ~SignatureVerifier() = default;

    /**
     * Verifies that \param signature was produced over \param message with
     * the private key of \param public_key
     * @return true if the signature is valid, false if it is not, error if
     * the check itself could not be performed
     */
    virtual outcome::result<bool> verify(
        const Signature &signature,
        qtils::BytesIn message,
        const PublicKey &public_key) const = 0;
  };

}  // namespace ledgersync::crypto
