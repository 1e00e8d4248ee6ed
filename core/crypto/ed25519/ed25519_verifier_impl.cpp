/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_verifier_impl.hpp"

#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>

OUTCOME_CPP_DEFINE_CATEGORY(ledgersync::crypto, Ed25519VerifierError, e) {
  using E = ledgersync::crypto::Ed25519VerifierError;
  switch (e) {
    case E::INVALID_PUBLIC_KEY:
      return "Public key can not be used for Ed25519 verification";
    case E::VERIFICATION_FAILED:
      return "Internal error during Ed25519 signature verification";
  }
  return "Unknown Ed25519VerifierError";
}

namespace ledgersync::crypto {

  namespace {
    using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
  }  // namespace

  Ed25519VerifierImpl::Ed25519VerifierImpl()
      : logger_{log::createLogger("Ed25519Verifier", "crypto")} {}

  outcome::result<bool> Ed25519VerifierImpl::verify(
      const Signature &signature,
      qtils::BytesIn message,
      const PublicKey &public_key) const {
    PKeyPtr pkey{EVP_PKEY_new_raw_public_key(
                     EVP_PKEY_ED25519, nullptr, public_key.data(),
                     public_key.size()),
                 &EVP_PKEY_free};
    if (not pkey) {
      ERR_clear_error();
      return Ed25519VerifierError::INVALID_PUBLIC_KEY;
    }

    MdCtxPtr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (not ctx
        or EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get())
               != 1) {
      ERR_clear_error();
      SL_ERROR(logger_, "Can't initialize Ed25519 verification context");
      return Ed25519VerifierError::VERIFICATION_FAILED;
    }

    auto res = EVP_DigestVerify(ctx.get(),
                                signature.data(),
                                signature.size(),
                                message.data(),
                                message.size());
    if (res == 1) {
      return true;
    }
    ERR_clear_error();
    if (res == 0) {
      return false;
    }
    SL_ERROR(logger_, "Ed25519 verification failed with code {}", res);
    return Ed25519VerifierError::VERIFICATION_FAILED;
  }

}  // namespace ledgersync::crypto
