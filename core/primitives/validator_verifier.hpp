/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <qtils/bytes.hpp>
#include <scale/scale.hpp>

#include "crypto/crypto_types.hpp"
#include "crypto/signature_verifier.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace ledgersync::primitives {

  /// Signatures of a ledger info by the validators that certified it
  using AggregateSignature = std::map<AccountAddress, crypto::Signature>;

  struct ValidatorConsensusInfo {
    SCALE_TIE(3);

    AccountAddress address{};
    crypto::PublicKey public_key{};
    VotingPower voting_power{};

    bool operator==(const ValidatorConsensusInfo &) const = default;
  };

  /**
   * @struct ValidatorVerifier checks that a set of signatures forms a quorum
   * of the validator set of an epoch
   */
  struct ValidatorVerifier {
    SCALE_TIE(3);

    std::vector<ValidatorConsensusInfo> validators;
    VotingPower quorum_voting_power{};
    VotingPower total_voting_power{};

    bool operator==(const ValidatorVerifier &) const = default;

    /**
     * Builds verifier with the quorum of more than two thirds of the total
     * voting power
     */
    static ValidatorVerifier fromValidators(
        std::vector<ValidatorConsensusInfo> validators);

    std::optional<VotingPower> getVotingPower(
        const AccountAddress &address) const;

    /**
     * Sums up voting power of {@param signers}
     * @return UNKNOWN_AUTHOR if one of signers is not a validator,
     * TOO_LITTLE_VOTING_POWER if the sum is below the quorum
     */
    outcome::result<VotingPower> checkVotingPower(
        const std::vector<AccountAddress> &signers) const;

    /**
     * Checks the signers and then every signature over {@param message}
     */
    outcome::result<void> verifyMultiSignatures(
        qtils::BytesIn message,
        const AggregateSignature &signatures,
        const crypto::SignatureVerifier &signature_verifier) const;
  };

}  // namespace ledgersync::primitives
