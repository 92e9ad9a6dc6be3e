/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>
#include <boost/operators.hpp>

#include "common/blob.hpp"

namespace trestle::primitives {
  using BlockNumber = uint32_t;
  using BlockHash = common::Hash256;

  namespace detail {
    // base data structure for the types describing block information
    // (BlockInfo, Precommit)
    template <typename Tag>
    struct BlockInfoT : public boost::equality_comparable<BlockInfoT<Tag>>,
                        public boost::less_than_comparable<BlockInfoT<Tag>> {
      BlockInfoT() = default;

      BlockInfoT(const BlockNumber &n, const BlockHash &h)
          : number(n), hash(h) {}

      BlockInfoT(const BlockHash &h, const BlockNumber &n)
          : number(n), hash(h) {}

      BlockNumber number{};
      BlockHash hash{};

      bool operator==(const BlockInfoT<Tag> &o) const {
        return number == o.number and hash == o.hash;
      }

      bool operator<(const BlockInfoT<Tag> &o) const {
        return number < o.number or (number == o.number and hash < o.hash);
      }
    };

    // encoded as (hash, number), the way GRANDPA votes are
    template <class Stream,
              typename Tag,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<(Stream &s, const BlockInfoT<Tag> &v) {
      return s << v.hash << v.number;
    }

    template <class Stream,
              typename Tag,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>(Stream &s, BlockInfoT<Tag> &v) {
      return s >> v.hash >> v.number;
    }
  }  // namespace detail

  using BlockInfo = detail::BlockInfoT<struct BlockInfoTag>;
}  // namespace trestle::primitives

template <typename Tag>
struct std::hash<trestle::primitives::detail::BlockInfoT<Tag>> {
  size_t operator()(
      const trestle::primitives::detail::BlockInfoT<Tag> &x) const {
    size_t hash = 0;
    boost::hash_combine(hash, x.number);
    boost::hash_combine(hash, std::hash<trestle::common::Hash256>()(x.hash));
    return hash;
  }
};

template <typename Tag>
struct fmt::formatter<trestle::primitives::detail::BlockInfoT<Tag>> {
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
  auto format(const trestle::primitives::detail::BlockInfoT<Tag> &block_info,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(
          ctx.out(), "#{} ({})", block_info.number, block_info.hash);
    }
    return fmt::format_to(
        ctx.out(), "#{} (0x{})", block_info.number, block_info.hash.toHex());
  }
};
