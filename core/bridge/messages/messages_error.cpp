/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/messages_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::bridge::messages, MessagesError, e) {
  using E = trestle::bridge::messages::MessagesError;
  switch (e) {
    case E::NOT_OPERATING_NORMALLY:
      return "Messages module doesn't accept outbound messages";
    case E::HALTED:
      return "Messages module is halted";
    case E::UNKNOWN_LANE:
      return "Lane is not opened";
    case E::LANE_ALREADY_EXISTS:
      return "Lane already exists";
    case E::INACTIVE_OUTBOUND_LANE:
      return "Outbound lane doesn't accept new messages";
    case E::INACTIVE_INBOUND_LANE:
      return "Inbound lane is closed";
    case E::MESSAGE_IS_TOO_LARGE:
      return "Message is too large";
    case E::MESSAGE_DISPATCH_INACTIVE:
      return "Message dispatcher is inactive";
    case E::TOO_MANY_MESSAGES_IN_THE_PROOF:
      return "Proof carries too many messages";
    case E::INVALID_MESSAGES_PROOF:
      return "Invalid messages proof";
    case E::INVALID_MESSAGES_DELIVERY_PROOF:
      return "Invalid messages delivery proof";
    case E::INVALID_UNREWARDED_RELAYERS_STATE:
      return "Declared unrewarded relayers state differs from the proven one";
    case E::INSUFFICIENT_DISPATCH_WEIGHT:
      return "Declared dispatch weight is lower than required by messages";
  }
  return "Unknown error (invalid MessagesError)";
}

OUTCOME_CPP_DEFINE_CATEGORY(trestle::bridge::messages, MessagesProofError, e) {
  using E = trestle::bridge::messages::MessagesProofError;
  switch (e) {
    case E::EMPTY:
      return "Proof has neither messages nor lane state";
    case E::MESSAGES_COUNT_MISMATCH:
      return "Number of messages in the proof differs from the declared one";
    case E::MISSING_REQUIRED_MESSAGE:
      return "Message is missing from the proof";
    case E::FAILED_TO_DECODE_MESSAGE:
      return "Failed to decode message from the proof";
    case E::FAILED_TO_DECODE_LANE_STATE:
      return "Failed to decode lane state from the proof";
    case E::MISSING_LANE_STATE:
      return "Lane state is missing from the proof";
  }
  return "Unknown error (invalid MessagesProofError)";
}
