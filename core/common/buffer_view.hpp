/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <compare>
#include <cstdint>
#include <ostream>
#include <span>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace trestle::common {

  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    template <typename T>
    decltype(auto) operator=(T &&t) {
      return span::operator=(std::forward<T>(t));
    }

    void dropFirst(size_t count) {
      *this = subspan(count);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    auto operator<=>(const BufferView &other) const {
      return std::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    bool operator==(const BufferView &other) const {
      return (*this <=> other) == std::strong_ordering::equal;
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

  template <typename Super, typename Prefix>
  bool startsWith(const Super &super, const Prefix &prefix) {
    if (std::size(super) >= std::size(prefix)) {
      return std::equal(
          std::begin(prefix), std::end(prefix), std::begin(super));
    }
    return false;
  }

}  // namespace trestle::common

namespace trestle {
  using common::BufferView;
}  // namespace trestle

template <>
struct fmt::formatter<trestle::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const trestle::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (view.empty()) {
      return fmt::format_to(ctx.out(), "<empty>");
    }
    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            view[0],
                            view[1],
                            view[view.size() - 2],
                            view[view.size() - 1]);
    }
    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
