/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::storage {

  /**
   * @brief universal storage interface error
   */
  enum class DatabaseError : int {
    NOT_FOUND = 1,
    CORRUPTION,
  };

}  // namespace trestle::storage

OUTCOME_HPP_DECLARE_ERROR(trestle::storage, DatabaseError);
