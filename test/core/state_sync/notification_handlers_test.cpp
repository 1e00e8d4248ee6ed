/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/notification_handlers.hpp"

#include <gtest/gtest.h>

#include "mock/core/events/event_subscription_service_mock.hpp"
#include "mock/core/mempool/mempool_notification_sender_mock.hpp"
#include "mock/core/metrics/registry_mock.hpp"
#include "mock/core/storage/db_reader_mock.hpp"
#include "state_sync/state_sync_error.hpp"
#include "testutil/ledger.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using ledgersync::events::EventSubscriptionServiceMock;
using ledgersync::mempool::CommittedTransaction;
using ledgersync::mempool::MempoolNotificationSenderMock;
using ledgersync::metrics::GaugeMock;
using ledgersync::metrics::Labels;
using ledgersync::metrics::RegistryMock;
using ledgersync::primitives::ContractEvent;
using ledgersync::primitives::Transaction;
using ledgersync::primitives::TransactionInfo;
using ledgersync::primitives::TransactionKind;
using ledgersync::primitives::Version;
using ledgersync::state_sync::CommitNotification;
using ledgersync::state_sync::CommittedTransactions;
using ledgersync::state_sync::handleCommittedTransactions;
using ledgersync::state_sync::initializeSyncVersionGauges;
using ledgersync::state_sync::MempoolNotificationHandler;
using ledgersync::state_sync::StateSyncError;
using ledgersync::state_sync::SyncMetrics;
using ledgersync::storage::DbReaderMock;
using testing::_;
using testing::ElementsAre;
using testing::NiceMock;
using testing::Return;
using testutil::makeAddress;
using testutil::makeTransaction;

class NotificationHandlersTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto registry = std::make_unique<NiceMock<RegistryMock>>();
    ON_CALL(*registry, registerGaugeMetric(_, _))
        .WillByDefault(
            [this](const std::string &, const Labels &labels) {
              return &gauges_[labels.at("operation")];
            });
    metrics_ = std::make_unique<SyncMetrics>(std::move(registry));
  }

  void expectStorageAt(Version version) {
    auto ledger_info = testutil::makeSignedLedgerInfo(epoch_5, version);
    EXPECT_CALL(storage_, getStartupInfo())
        .WillRepeatedly(Return(std::make_optional(
            testutil::makeStartupInfo(ledger_info, epoch_5))));
    EXPECT_CALL(storage_, getLatestTransactionInfoOption())
        .WillRepeatedly(Return(
            std::make_optional(std::make_pair(version, TransactionInfo{}))));
  }

  ledgersync::primitives::EpochState epoch_5 = testutil::makeEpochState(5);
  std::shared_ptr<MempoolNotificationSenderMock> mempool_sender_ =
      std::make_shared<MempoolNotificationSenderMock>();
  MempoolNotificationHandler mempool_handler_{mempool_sender_};
  EventSubscriptionServiceMock event_service_;
  DbReaderMock storage_;
  std::map<std::string, NiceMock<GaugeMock>> gauges_;
  std::unique_ptr<SyncMetrics> metrics_;

  std::vector<Transaction> transactions_{
      makeTransaction(TransactionKind::BlockMetadata, 0, 0),
      makeTransaction(TransactionKind::User, 1, 7),
      makeTransaction(TransactionKind::StateCheckpoint, 0, 0),
      makeTransaction(TransactionKind::User, 2, 3),
  };
  std::vector<ContractEvent> events_{
      ContractEvent{ledgersync::primitives::kNewEpochEventKey, 0, "", {}}};
};

/**
 * @given committed transactions of several kinds
 * @when notifying mempool
 * @then only user transactions are sent with the block timestamp
 */
TEST_F(NotificationHandlersTest, MempoolGetsUserTransactionsOnly) {
  EXPECT_CALL(*mempool_sender_,
              notifyNewCommits(
                  ElementsAre(CommittedTransaction{makeAddress(1), 7},
                              CommittedTransaction{makeAddress(2), 3}),
                  1234))
      .WillOnce(Return(outcome::success()));
  EXPECT_OUTCOME_TRUE_1(
      mempool_handler_.notifyMempoolOfCommittedTransactions(transactions_,
                                                            1234));
}

/**
 * @given committed transactions without user transactions
 * @when notifying mempool
 * @then mempool is not called
 */
TEST_F(NotificationHandlersTest, NothingForMempool) {
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, _)).Times(0);
  EXPECT_OUTCOME_TRUE_1(mempool_handler_.notifyMempoolOfCommittedTransactions(
      {makeTransaction(TransactionKind::BlockMetadata, 0, 0)}, 1));
}

/**
 * @given mempool failing to accept a notification
 * @when notifying mempool
 * @then notification error is reported
 */
TEST_F(NotificationHandlersTest, MempoolFailure) {
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, _))
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_EC(
      mempool_handler_.notifyMempoolOfCommittedTransactions(transactions_, 1),
      StateSyncError::NOTIFICATION_ERROR);
}

/**
 * @given committed transactions and events
 * @when handling the commit notification
 * @then mempool is notified before the event service
 */
TEST_F(NotificationHandlersTest, MempoolThenEvents) {
  auto ledger_info = testutil::makeSignedLedgerInfo(epoch_5, 110);
  testing::InSequence seq;
  EXPECT_CALL(*mempool_sender_,
              notifyNewCommits(_, ledger_info.ledger_info.timestamp_usecs))
      .WillOnce(Return(outcome::success()));
  EXPECT_CALL(event_service_, notifyEvents(110, events_))
      .WillOnce(Return(outcome::success()));
  EXPECT_OUTCOME_TRUE_1(CommitNotification::handleTransactionNotification(
      events_, transactions_, 110, ledger_info, mempool_handler_,
      event_service_));
}

/**
 * @given mempool failing to accept a notification
 * @when handling the commit notification
 * @then event service is not called and notification error is reported
 */
TEST_F(NotificationHandlersTest, MempoolFailureStopsNotification) {
  auto ledger_info = testutil::makeSignedLedgerInfo(epoch_5, 110);
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, _))
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_CALL(event_service_, notifyEvents(_, _)).Times(0);
  EXPECT_EC(CommitNotification::handleTransactionNotification(
                events_, transactions_, 110, ledger_info, mempool_handler_,
                event_service_),
            StateSyncError::NOTIFICATION_ERROR);
}

/**
 * @given event service failing to deliver events
 * @when handling the commit notification
 * @then notification error is reported
 */
TEST_F(NotificationHandlersTest, EventServiceFailure) {
  auto ledger_info = testutil::makeSignedLedgerInfo(epoch_5, 110);
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, _))
      .WillOnce(Return(outcome::success()));
  EXPECT_CALL(event_service_, notifyEvents(110, _))
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_EC(CommitNotification::handleTransactionNotification(
                events_, transactions_, 110, ledger_info, mempool_handler_,
                event_service_),
            StateSyncError::NOTIFICATION_ERROR);
}

/**
 * @given storage synced to version 110
 * @when handling committed transactions
 * @then synced gauge and downstream consumers get the version of storage
 */
TEST_F(NotificationHandlersTest, HandleCommittedTransactions) {
  expectStorageAt(110);
  EXPECT_CALL(gauges_["synced"], set(110.0));
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, 110'000'000))
      .WillOnce(Return(outcome::success()));
  EXPECT_CALL(event_service_, notifyEvents(110, events_))
      .WillOnce(Return(outcome::success()));

  handleCommittedTransactions(CommittedTransactions{events_, transactions_},
                              storage_,
                              mempool_handler_,
                              event_service_,
                              *metrics_);
}

/**
 * @given storage which can not be read and a failing mempool
 * @when handling committed transactions
 * @then failures are swallowed after logging
 */
TEST_F(NotificationHandlersTest, HandleCommittedTransactionsFailures) {
  EXPECT_CALL(storage_, getStartupInfo())
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, _)).Times(0);
  handleCommittedTransactions(CommittedTransactions{events_, transactions_},
                              storage_,
                              mempool_handler_,
                              event_service_,
                              *metrics_);

  expectStorageAt(120);
  EXPECT_CALL(*mempool_sender_, notifyNewCommits(_, _))
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_CALL(event_service_, notifyEvents(_, _)).Times(0);
  handleCommittedTransactions(CommittedTransactions{events_, transactions_},
                              storage_,
                              mempool_handler_,
                              event_service_,
                              *metrics_);
}

/**
 * @given storage synced to version 100
 * @when initializing sync gauges
 * @then every gauge is set to the synced version
 */
TEST_F(NotificationHandlersTest, InitializeGauges) {
  expectStorageAt(100);
  EXPECT_CALL(gauges_["applied_transaction_outputs"], set(100.0));
  EXPECT_CALL(gauges_["executed_transactions"], set(100.0));
  EXPECT_CALL(gauges_["synced"], set(100.0));
  EXPECT_OUTCOME_TRUE_1(initializeSyncVersionGauges(storage_, *metrics_));
}
