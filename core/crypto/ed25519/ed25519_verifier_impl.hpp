/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/signature_verifier.hpp"
#include "log/logger.hpp"

namespace ledgersync::crypto {

  enum class Ed25519VerifierError {
    INVALID_PUBLIC_KEY = 1,
    VERIFICATION_FAILED,
  };

  /**
   * Ed25519 signature verification backed by OpenSSL
   */
  class Ed25519VerifierImpl : public SignatureVerifier {
   public:
    Ed25519VerifierImpl();

    outcome::result<bool> verify(const Signature &signature,
                                 qtils::BytesIn message,
                                 const PublicKey &public_key) const override;

   private:
    log::Logger logger_;
  };

}  // namespace ledgersync::crypto

OUTCOME_HPP_DECLARE_ERROR(ledgersync::crypto, Ed25519VerifierError);
