/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace trestle::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    VALUE_OUT_OF_RANGE,
    MISSING_0X_PREFIX,
    UNKNOWN
  };

}  // namespace trestle::common

OUTCOME_HPP_DECLARE_ERROR(trestle::common, UnhexError);

namespace trestle::common {

  /**
   * @brief Converts bytes to hex representation
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string, both uppercase and lowercase are accepted
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

  /**
   * @brief unhex hex-string with 0x in the beginning into unsigned number
   * @tparam T unsigned integer value type to decode
   * @param value source hex string
   * @return unhexed value
   */
  template <class T, typename = std::enable_if<std::is_unsigned_v<T>>>
  outcome::result<T> unhexNumber(std::string_view value) {
    OUTCOME_TRY(bytes, common::unhexWith0x(value));
    if (bytes.size() > sizeof(T)) {
      return UnhexError::VALUE_OUT_OF_RANGE;
    }
    T result{0u};
    for (auto b : bytes) {
      if constexpr (sizeof(T) > 1) {
        result <<= 8u;
      } else {
        result = 0;
      }
      result += b;
    }
    return result;
  }

}  // namespace trestle::common
