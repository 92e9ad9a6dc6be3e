/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/lane_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::bridge::messages, LaneError, e) {
  using E = trestle::bridge::messages::LaneError;
  switch (e) {
    case E::FAILED_TO_CONFIRM_FUTURE_MESSAGES:
      return "Delivery of messages which were never sent is confirmed";
    case E::EMPTY_UNREWARDED_RELAYER_ENTRY:
      return "Unrewarded relayer entry has an empty messages range";
    case E::NON_CONSECUTIVE_UNREWARDED_RELAYER_ENTRIES:
      return "Unrewarded relayer entries are not consecutive";
    case E::TRYING_TO_CONFIRM_MORE_MESSAGES_THAN_EXPECTED:
      return "Confirmation covers more messages than declared";
  }
  return "Unknown error (invalid LaneError)";
}
