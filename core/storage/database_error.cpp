/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::storage, DatabaseError, e) {
  using E = trestle::storage::DatabaseError;
  switch (e) {
    case E::NOT_FOUND:
      return "entry not found in storage";
    case E::CORRUPTION:
      return "stored value can not be decoded";
  }
  return "unknown error";
}
