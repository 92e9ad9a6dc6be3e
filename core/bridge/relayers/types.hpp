/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/types.hpp"

namespace trestle::bridge::relayers {

  /// Side of the lane whose sovereign account pays the reward
  enum class RewardsAccountOwner : uint8_t {
    THIS_CHAIN = 0,
    BRIDGED_CHAIN = 1,
  };

  /// Kind of the reward: which lane and which side of the bridge pays it
  struct RewardsAccountParams {
    messages::LaneId lane;
    ChainId bridged_chain;
    RewardsAccountOwner owner = RewardsAccountOwner::THIS_CHAIN;

    bool operator==(const RewardsAccountParams &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const RewardsAccountParams &v) {
    return s << v.lane << v.bridged_chain << static_cast<uint8_t>(v.owner);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, RewardsAccountParams &v) {
    uint8_t owner = 0;
    s >> v.lane >> v.bridged_chain >> owner;
    if (owner > static_cast<uint8_t>(RewardsAccountOwner::BRIDGED_CHAIN)) {
      common::raise(scale::DecodeError::UNEXPECTED_VALUE);
    }
    v.owner = static_cast<RewardsAccountOwner>(owner);
    return s;
  }

  struct RelayerRewardKey {
    AccountId relayer;
    RewardsAccountParams params;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const RelayerRewardKey &v) {
    return s << v.relayer << v.params;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, RelayerRewardKey &v) {
    return s >> v.relayer >> v.params;
  }

}  // namespace trestle::bridge::relayers

template <>
struct fmt::formatter<trestle::bridge::relayers::RewardsAccountParams> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const trestle::bridge::relayers::RewardsAccountParams &params,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    using trestle::bridge::relayers::RewardsAccountOwner;
    return fmt::format_to(
        ctx.out(),
        "{}/{}/{}",
        params.lane,
        params.bridged_chain,
        params.owner == RewardsAccountOwner::THIS_CHAIN ? "this" : "bridged");
  }
};
