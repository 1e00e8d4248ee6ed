/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <variant>

#include "primitives/ledger_info.hpp"
#include "primitives/transaction.hpp"

namespace ledgersync::streaming {

  using NotificationId = uint64_t;
  using DataStreamId = uint64_t;

  /// Marker sent by the streaming service when the stream target is reached
  struct EndOfStream {
    bool operator==(const EndOfStream &) const = default;
  };

  struct ContinuousTransactionOutputsWithProof {
    primitives::LedgerInfoWithSignatures ledger_info_with_signatures;
    primitives::TransactionOutputListWithProof output_list_with_proof;

    bool operator==(const ContinuousTransactionOutputsWithProof &) const =
        default;
  };

  struct ContinuousTransactionsWithProof {
    primitives::LedgerInfoWithSignatures ledger_info_with_signatures;
    primitives::TransactionListWithProof transaction_list_with_proof;

    bool operator==(const ContinuousTransactionsWithProof &) const = default;
  };

  using DataPayload = std::variant<ContinuousTransactionOutputsWithProof,
                                   ContinuousTransactionsWithProof,
                                   EndOfStream>;

  /**
   * @struct DataNotification is a single unit of data delivered by a data
   * stream. Feedback about it is sent back using its id.
   */
  struct DataNotification {
    NotificationId notification_id{};
    DataPayload data_payload;

    bool operator==(const DataNotification &) const = default;
  };

}  // namespace ledgersync::streaming
