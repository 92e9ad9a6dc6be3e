/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::bridge::messages {

  enum class MessagesError : uint8_t {
    NOT_OPERATING_NORMALLY = 1,
    HALTED,
    UNKNOWN_LANE,
    LANE_ALREADY_EXISTS,
    /// Lane doesn't accept new messages
    INACTIVE_OUTBOUND_LANE,
    /// Lane doesn't accept deliveries
    INACTIVE_INBOUND_LANE,
    MESSAGE_IS_TOO_LARGE,
    MESSAGE_DISPATCH_INACTIVE,
    TOO_MANY_MESSAGES_IN_THE_PROOF,
    INVALID_MESSAGES_PROOF,
    INVALID_MESSAGES_DELIVERY_PROOF,
    INVALID_UNREWARDED_RELAYERS_STATE,
    INSUFFICIENT_DISPATCH_WEIGHT,
  };

  /// Errors of reading messages and lane states from storage proofs
  enum class MessagesProofError : uint8_t {
    EMPTY = 1,
    MESSAGES_COUNT_MISMATCH,
    MISSING_REQUIRED_MESSAGE,
    FAILED_TO_DECODE_MESSAGE,
    FAILED_TO_DECODE_LANE_STATE,
    MISSING_LANE_STATE,
  };

}  // namespace trestle::bridge::messages

OUTCOME_HPP_DECLARE_ERROR(trestle::bridge::messages, MessagesError);
OUTCOME_HPP_DECLARE_ERROR(trestle::bridge::messages, MessagesProofError);
