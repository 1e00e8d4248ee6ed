/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace testutil {
  /**
   * @name Dummy error
   * @brief Error returned by mocked collaborators, so that tests do not need
   * to link the error categories of real implementations
   */
  enum class DummyError { ERROR = 1, ERROR_2, ERROR_3 };
}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, DummyError);
