/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/validator_verifier.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "primitives/verify_error.hpp"

namespace ledgersync::primitives {

  ValidatorVerifier ValidatorVerifier::fromValidators(
      std::vector<ValidatorConsensusInfo> validators) {
    VotingPower total = 0;
    for (auto &validator : validators) {
      total += validator.voting_power;
    }
    // floor(2 * total / 3) + 1 without overflowing 2 * total
    VotingPower quorum =
        total == 0 ? 0 : total / 3 * 2 + (total % 3) * 2 / 3 + 1;
    ValidatorVerifier verifier;
    verifier.validators = std::move(validators);
    verifier.quorum_voting_power = quorum;
    verifier.total_voting_power = total;
    return verifier;
  }

  std::optional<VotingPower> ValidatorVerifier::getVotingPower(
      const AccountAddress &address) const {
    auto it = std::find_if(
        validators.begin(), validators.end(), [&](const auto &validator) {
          return validator.address == address;
        });
    if (it == validators.end()) {
      return std::nullopt;
    }
    return it->voting_power;
  }

  outcome::result<VotingPower> ValidatorVerifier::checkVotingPower(
      const std::vector<AccountAddress> &signers) const {
    VotingPower aggregated = 0;
    for (auto &signer : signers) {
      auto power = getVotingPower(signer);
      if (not power) {
        return VerifyError::UNKNOWN_AUTHOR;
      }
      aggregated += *power;
    }
    if (aggregated < quorum_voting_power) {
      return VerifyError::TOO_LITTLE_VOTING_POWER;
    }
    return aggregated;
  }

  outcome::result<void> ValidatorVerifier::verifyMultiSignatures(
      qtils::BytesIn message,
      const AggregateSignature &signatures,
      const crypto::SignatureVerifier &signature_verifier) const {
    std::vector<AccountAddress> signers;
    signers.reserve(signatures.size());
    for (auto &[address, _] : signatures) {
      signers.push_back(address);
    }
    OUTCOME_TRY(checkVotingPower(signers));

    for (auto &[address, signature] : signatures) {
      auto it = std::find_if(
          validators.begin(), validators.end(), [&](const auto &validator) {
            return validator.address == address;
          });
      BOOST_ASSERT(it != validators.end());
      OUTCOME_TRY(valid,
                  signature_verifier.verify(signature, message, it->public_key));
      if (not valid) {
        return VerifyError::INVALID_SIGNATURE;
      }
    }
    return outcome::success();
  }

}  // namespace ledgersync::primitives
