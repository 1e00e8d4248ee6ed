/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace ledgersync::streaming {

  enum class DataStreamError {
    TIMEOUT = 1,
    STREAM_CLOSED,
  };

}  // namespace ledgersync::streaming

OUTCOME_HPP_DECLARE_ERROR(ledgersync::streaming, DataStreamError);
