/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

#include "outcome/outcome.hpp"

namespace trestle::common {
  /**
   * @brief throws outcome::result error as boost exception
   * Used inside SCALE decoders, where scale::decode converts the exception
   * back into an outcome error.
   * @tparam T enum error type, only outcome::result enums are allowed
   * @param t error value
   */
  template <typename T>
    requires std::is_enum_v<T>
  [[noreturn]] void raise(T t) {
    std::error_code ec = make_error_code(t);
    boost::throw_exception(std::system_error(ec));
  }

  /**
   * @brief throws outcome::result error made of error as boost exception
   * @tparam T outcome error type
   * @param t outcome error value
   */
  template <typename T>
    requires(not std::is_enum_v<T>)
  [[noreturn]] void raise(const T &t) {
    boost::throw_exception(std::system_error(t.value(), t.category()));
  }
}  // namespace trestle::common
