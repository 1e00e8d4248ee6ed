/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "primitives/common.hpp"
#include "primitives/contract_event.hpp"

namespace ledgersync::primitives {

  enum class TransactionKind : uint8_t {
    User,
    BlockMetadata,
    StateCheckpoint,
    Genesis,
  };

  struct Transaction {
    TransactionKind kind{TransactionKind::User};
    AccountAddress sender{};
    uint64_t sequence_number{};
    std::vector<uint8_t> payload;

    bool operator==(const Transaction &) const = default;

    bool isUserTransaction() const {
      return kind == TransactionKind::User;
    }
  };

  /// Committed result of a transaction, part of the accumulator proof
  struct TransactionInfo {
    HashValue transaction_hash{};
    HashValue state_change_hash{};
    HashValue event_root_hash{};
    uint64_t gas_used{};
    bool success{};

    bool operator==(const TransactionInfo &) const = default;
  };

  struct TransactionOutput {
    std::vector<ContractEvent> events;
    uint64_t gas_used{};
    bool success{};
    std::vector<uint8_t> write_set;

    bool operator==(const TransactionOutput &) const = default;
  };

  /**
   * Transaction infos of a range together with the accumulator range proof
   * linking them to a ledger info. The proof bytes are checked by the
   * storage synchronizer, never by the state sync driver.
   */
  struct TransactionInfoListWithProof {
    std::vector<TransactionInfo> transaction_infos;
    std::vector<uint8_t> ledger_info_to_transaction_infos_proof;

    bool operator==(const TransactionInfoListWithProof &) const = default;
  };

  struct TransactionListWithProof {
    std::vector<Transaction> transactions;
    /// Events of each transaction, if requested
    std::optional<std::vector<std::vector<ContractEvent>>> events;
    std::optional<Version> first_transaction_version;
    TransactionInfoListWithProof proof;

    bool operator==(const TransactionListWithProof &) const = default;

    size_t size() const {
      return transactions.size();
    }
  };

  struct TransactionOutputListWithProof {
    std::vector<std::pair<Transaction, TransactionOutput>>
        transactions_and_outputs;
    std::optional<Version> first_transaction_output_version;
    TransactionInfoListWithProof proof;

    bool operator==(const TransactionOutputListWithProof &) const = default;

    size_t size() const {
      return transactions_and_outputs.size();
    }
  };

}  // namespace ledgersync::primitives
