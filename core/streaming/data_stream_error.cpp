/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "streaming/data_stream_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ledgersync::streaming, DataStreamError, e) {
  using E = ledgersync::streaming::DataStreamError;
  switch (e) {
    case E::TIMEOUT:
      return "No notification arrived in time";
    case E::STREAM_CLOSED:
      return "Data stream is closed";
  }
  return "Unknown DataStreamError";
}
