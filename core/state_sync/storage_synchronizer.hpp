/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/contract_event.hpp"
#include "primitives/ledger_info.hpp"
#include "primitives/transaction.hpp"

namespace ledgersync::state_sync {

  /// Transactions durably written by the storage synchronizer
  struct CommittedTransactions {
    std::vector<primitives::ContractEvent> events;
    std::vector<primitives::Transaction> transactions;

    bool operator==(const CommittedTransactions &) const = default;
  };

  /**
   * Verifies data chunks against the target ledger info and writes them to
   * storage. A version is either committed together with its ledger info or
   * not committed at all.
   */
  class StorageSynchronizer {
   public:
    virtual ~StorageSynchronizer() = default;

    virtual outcome::result<CommittedTransactions> applyTransactionOutputs(
        const primitives::TransactionOutputListWithProof &output_list_with_proof,
        const primitives::LedgerInfoWithSignatures &target_ledger_info,
        const std::optional<primitives::LedgerInfoWithSignatures>
            &end_of_epoch_ledger_info) = 0;

    virtual outcome::result<CommittedTransactions> executeTransactions(
        const primitives::TransactionListWithProof &transaction_list_with_proof,
        const primitives::LedgerInfoWithSignatures &target_ledger_info,
        const std::optional<primitives::LedgerInfoWithSignatures>
            &end_of_epoch_ledger_info) = 0;
  };

}  // namespace ledgersync::state_sync
