/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::bridge::messages {

  /// Errors of the delivery confirmation at the outbound lane
  enum class LaneError : uint8_t {
    FAILED_TO_CONFIRM_FUTURE_MESSAGES = 1,
    EMPTY_UNREWARDED_RELAYER_ENTRY,
    NON_CONSECUTIVE_UNREWARDED_RELAYER_ENTRIES,
    TRYING_TO_CONFIRM_MORE_MESSAGES_THAN_EXPECTED,
  };

}  // namespace trestle::bridge::messages

OUTCOME_HPP_DECLARE_ERROR(trestle::bridge::messages, LaneError);
