/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "bridge/account_id.hpp"
#include "bridge/messages/types.hpp"
#include "bridge/parachains/types.hpp"
#include "primitives/runtime_version.hpp"

namespace trestle::relay {

  using namespace std::chrono_literals;

  /// Timings shared by every task of the engine
  struct RelayTimings {
    /// Delay between two polls of the chains
    std::chrono::milliseconds tick_interval = 1000ms;
    /// Delay after which a submitted but not imported header is resubmitted
    std::chrono::milliseconds stall_timeout = 30000ms;
    std::chrono::milliseconds backoff_initial = 500ms;
    std::chrono::milliseconds backoff_max = 30000ms;
    /// Source headers read by one finality tick at most
    uint32_t max_headers_per_tick = 128;
  };

  /// Parameters of the relay of one message lane
  struct MessageLaneParams {
    bridge::messages::LaneId lane;
    /// Account which signs deliveries and confirmations, gets the rewards
    bridge::AccountId relayer;
    bridge::messages::MessageNonce max_messages_in_tx = 16;
    /// Limits of the target inbound lane
    size_t max_unrewarded_relayer_entries = 16;
    bridge::messages::MessageNonce max_unconfirmed_messages = 128;
    bridge::messages::Weight dispatch_weight_per_message = 1000;
  };

  struct ParachainsParams {
    std::vector<bridge::parachains::ParaId> para_ids;
  };

  struct RuntimeGuardParams {
    /// Version the relay is built for. The first seen one if not set.
    std::optional<uint32_t> expected_spec_version;
  };

}  // namespace trestle::relay
