/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/justification_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::consensus::grandpa,
                            JustificationError,
                            e) {
  using E = trestle::consensus::grandpa::JustificationError;
  switch (e) {
    case E::JUSTIFICATION_DECODE:
      return "Justification can not be decoded";
    case E::INVALID_JUSTIFICATION_TARGET:
      return "Justification is finalizing unexpected header";
    case E::EQUIVOCATING_AUTHORITY_VOTE:
      return "Justification contains two different votes of one authority";
    case E::UNRELATED_ANCESTRY_VOTE:
      return "Precommit target is not a descendant of the commit target";
    case E::REDUNDANT_VOTES_ANCESTRIES:
      return "Justification contains unused or duplicate votes ancestries";
    case E::TOO_LOW_CUMULATIVE_WEIGHT:
      return "Cumulative weight of precommits is below the threshold";
    case E::INVALID_ROUND:
      return "Justification is for another round";
  }
  return "Unknown error (invalid JustificationError)";
}
