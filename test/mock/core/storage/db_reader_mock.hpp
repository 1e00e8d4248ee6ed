/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/db_reader.hpp"

#include <gmock/gmock.h>

namespace ledgersync::storage {

  class DbReaderMock : public DbReader {
   public:
    using LatestTransactionInfo =
        std::optional<std::pair<primitives::Version,
                                primitives::TransactionInfo>>;

    MOCK_METHOD(outcome::result<std::optional<StartupInfo>>,
                getStartupInfo,
                (),
                (const, override));

    MOCK_METHOD(outcome::result<LatestTransactionInfo>,
                getLatestTransactionInfoOption,
                (),
                (const, override));
  };

}  // namespace ledgersync::storage
