/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::bridge::header_chain {

  enum class HeaderChainError : uint8_t {
    NOT_INITIALIZED = 1,
    ALREADY_INITIALIZED,
    HALTED,
    OLD_HEADER,
    UNKNOWN_HEADER,
    INVALID_AUTHORITY_SET_ID,
    INVALID_AUTHORITY_SET,
    INVALID_JUSTIFICATION,
    UNSUPPORTED_SCHEDULED_CHANGE,
    TOO_MANY_AUTHORITIES_IN_SET,
    HEADER_OVERFLOW_LIMITS,
    INVALID_OPERATING_MODE,
  };

}  // namespace trestle::bridge::header_chain

OUTCOME_HPP_DECLARE_ERROR(trestle::bridge::header_chain, HeaderChainError);
