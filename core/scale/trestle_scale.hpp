/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace trestle::scale {

  using ::scale::CompactInteger;
  using ::scale::DecodeError;
  using ::scale::ScaleDecoderStream;
  using ::scale::ScaleEncoderStream;

  /**
   * Encodes values one after another into a single buffer
   */
  template <typename... Args>
  outcome::result<common::Buffer> encode(const Args &...args) {
    OUTCOME_TRY(bytes, ::scale::encode(args...));
    return common::Buffer(std::move(bytes));
  }

  template <typename T>
  outcome::result<T> decode(common::BufferView bytes) {
    return ::scale::decode<T>(bytes);
  }

  /**
   * Size of the encoded value, used for size limits and fee estimations
   */
  template <typename T>
  outcome::result<size_t> encodedSize(const T &value) {
    OUTCOME_TRY(bytes, ::scale::encode(value));
    return bytes.size();
  }

}  // namespace trestle::scale
