/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <fmt/format.h>

namespace trestle::primitives {

  /**
   * Part of the runtime version, which defines encodings of the calls and
   * storage of a runtime. A change means previously built transactions
   * could be interpreted differently.
   */
  struct RuntimeVersion {
    std::string spec_name;
    uint32_t spec_version = 0u;
    uint32_t transaction_version = 0u;

    bool operator==(const RuntimeVersion &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const RuntimeVersion &v) {
    return s << v.spec_name << v.spec_version << v.transaction_version;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, RuntimeVersion &v) {
    return s >> v.spec_name >> v.spec_version >> v.transaction_version;
  }

}  // namespace trestle::primitives

template <>
struct fmt::formatter<trestle::primitives::RuntimeVersion> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const trestle::primitives::RuntimeVersion &v,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "{}-{} (tx {})",
                          v.spec_name,
                          v.spec_version,
                          v.transaction_version);
  }
};
