/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/epoch_state.hpp"

#include <gtest/gtest.h>

#include "primitives/ledger_info.hpp"
#include "primitives/verify_error.hpp"
#include "testutil/ledger.hpp"
#include "testutil/outcome.hpp"

using ledgersync::primitives::VerifyError;
using testutil::makeEpochState;
using testutil::makeLedgerInfo;
using testutil::makeSignedLedgerInfo;
using testutil::signLedgerInfo;

class EpochStateTest : public testing::Test {
 public:
  ledgersync::primitives::EpochState epoch_state = makeEpochState(5);
  testutil::FakeSignatureVerifier signature_verifier;
};

/**
 * @given ledger info of the epoch signed by all validators
 * @when verifying it with the epoch state
 * @then verification succeeds
 */
TEST_F(EpochStateTest, ValidLedgerInfo) {
  auto ledger_info = makeSignedLedgerInfo(epoch_state, 110);
  EXPECT_OUTCOME_TRUE_1(epoch_state.verify(ledger_info, signature_verifier));
}

/**
 * @given ledger info of another epoch signed by the same validators
 * @when verifying it with the epoch state
 * @then epoch mismatch is reported
 */
TEST_F(EpochStateTest, LedgerInfoOfAnotherEpoch) {
  auto ledger_info =
      signLedgerInfo(makeLedgerInfo(6, 110), epoch_state, 4);
  EXPECT_EC(epoch_state.verify(ledger_info, signature_verifier),
            VerifyError::INCONSISTENT_EPOCH);
}

/**
 * @given signed ledger info whose version was changed after signing
 * @when verifying it with the epoch state
 * @then signatures do not match
 */
TEST_F(EpochStateTest, TamperedLedgerInfo) {
  auto ledger_info = makeSignedLedgerInfo(epoch_state, 110);
  ledger_info.ledger_info.version = 111;
  EXPECT_EC(epoch_state.verify(ledger_info, signature_verifier),
            VerifyError::INVALID_SIGNATURE);
}

/**
 * @given ledger info signed by validators of another set
 * @when verifying it with the epoch state
 * @then signers are unknown
 */
TEST_F(EpochStateTest, SignedByStrangers) {
  auto strangers = makeEpochState(5, 4, 100);
  auto ledger_info = makeSignedLedgerInfo(strangers, 110);
  EXPECT_EC(epoch_state.verify(ledger_info, signature_verifier),
            VerifyError::UNKNOWN_AUTHOR);
}
