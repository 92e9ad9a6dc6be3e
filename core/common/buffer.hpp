/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <boost/container_hash/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace trestle::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    Buffer &operator+=(const BufferView &view) {
      return put(view);
    }

    /**
     * @brief Put a 8-bit {@param n} in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint8(uint8_t n) {
      push_back(n);
      return *this;
    }

    /**
     * @brief Put a string into byte buffer
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put a sequence of bytes as view into byte buffer
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    const Base &asVector() const {
      return *this;
    }

    Base &asVector() {
      return *this;
    }

    BufferView view(size_t offset = 0, size_t length = -1) const {
      return std::span(*this).subspan(offset, length);
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(*this);
    }

    /**
     * @brief Construct Buffer from hex string
     */
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return outcome::success(Buffer(std::move(bytes)));
    }

    /**
     * @brief return content of bytearray as string
     * @note Does not ensure correct encoding
     */
    std::string toString() const {
      return std::string{cbegin(), cend()};
    }

    /**
     * @brief stores content of a string to byte array
     */
    static Buffer fromString(std::string_view src) {
      return {src.begin(), src.end()};
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Buffer &buffer) {
    return s << buffer.asVector();
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Buffer &buffer) {
    return s >> buffer.asVector();
  }

  namespace literals {
    /// creates a buffer filled with characters from the original string
    inline Buffer operator""_buf(const char *c, size_t s) {
      return Buffer(std::vector<uint8_t>(c, c + s));
    }

    inline Buffer operator""_hex2buf(const char *hex, size_t size) {
      return Buffer::fromHex(std::string_view{hex, size}).value();
    }
  }  // namespace literals

}  // namespace trestle::common

namespace trestle {
  using common::Buffer;
}  // namespace trestle

template <>
struct std::hash<trestle::common::Buffer> {
  size_t operator()(const trestle::common::Buffer &x) const {
    return boost::hash_range(x.begin(), x.end());
  }
};

template <>
struct fmt::formatter<trestle::common::Buffer>
    : fmt::formatter<trestle::common::BufferView> {};
