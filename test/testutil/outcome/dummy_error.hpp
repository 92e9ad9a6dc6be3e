/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace testutil {

  /// Error returned by mocks, so that tests don't depend on module errors
  enum class DummyError : uint8_t {
    ERROR = 1,
    ERROR_2,
  };

}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, DummyError);
