/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/grandpa/justification_verifier.hpp"
#include "consensus/grandpa/structs.hpp"
#include "primitives/authority.hpp"
#include "primitives/block_header.hpp"

namespace trestle::bridge::header_chain {

  using primitives::BlockHash;
  using primitives::BlockInfo;
  using primitives::BlockNumber;

  enum class BasicOperatingMode : uint8_t {
    NORMAL = 0,
    HALTED = 1,
  };

  /// Everything needed to start tracking the bridged chain
  struct InitializationData {
    primitives::BlockHeader header;
    primitives::AuthorityList authority_list;
    primitives::AuthoritySetId set_id{};
    BasicOperatingMode operating_mode = BasicOperatingMode::NORMAL;
  };

  /// Part of an imported header needed by the other modules
  struct StoredHeaderData {
    BlockNumber number{};
    common::Hash256 state_root;

    bool operator==(const StoredHeaderData &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const StoredHeaderData &v) {
    return s << v.number << v.state_root;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, StoredHeaderData &v) {
    return s >> v.number >> v.state_root;
  }

  struct HeaderChainConfig {
    /// Size of the imported headers ring buffer
    uint32_t headers_to_keep = 1024;
    uint32_t max_authorities = 2048;
    /// Max encoded size of a submitted header
    uint32_t max_header_size = 65536;
    consensus::grandpa::JustificationSizeLimits justification_limits;
  };

  /// Call importing a finalized header of the bridged chain
  struct SubmitFinalityProofCall {
    primitives::BlockHeader finality_target;
    consensus::grandpa::GrandpaJustification justification;
    primitives::AuthoritySetId current_set_id{};
  };

  /// Facts about a finality proof, known before it is dispatched
  struct SubmitFinalityProofInfo {
    BlockNumber block_number{};
    primitives::AuthoritySetId current_set_id{};
    /// Header changes the authority set, so it can't be skipped
    bool is_mandatory = false;
    /// Encoded size of the justification above the reasonable one
    uint32_t extra_size = 0;

    bool operator==(const SubmitFinalityProofInfo &rhs) const = default;
  };

}  // namespace trestle::bridge::header_chain
