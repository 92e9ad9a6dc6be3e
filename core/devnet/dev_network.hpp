/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "devnet/dev_chain.hpp"
#include "relay/relay_context.hpp"

namespace trestle::devnet {

  using namespace std::chrono_literals;

  struct DevNetworkConfig {
    std::chrono::milliseconds block_time = 1000ms;
    /// Period of sending a message to every lane, never if zero
    std::chrono::milliseconds message_interval = 2000ms;
    uint32_t authorities = 4;
    uint32_t justification_period = 4;
    uint32_t authority_set_change_period = 0;
    /// Lanes from the source to the target chain
    std::vector<bridge::messages::LaneId> lanes;
    /// Parachains of the source chain, their heads change every block
    std::vector<bridge::parachains::ParaId> parachains;
    primitives::RuntimeVersion target_runtime_version{
        .spec_name = "millau", .spec_version = 1, .transaction_version = 1};
    /// Target runtime spec version is bumped at this target block
    std::optional<primitives::BlockNumber> target_runtime_upgrade_at;
    bridge::messages::MessagesConfig messages;
    bridge::relayers::RewardsConfig rewards{
        .delivery_reward_per_message = 10, .confirmation_reward = 1};
  };

  /**
   * Pair of bridged development chains. The source chain sends messages and
   * keeps the parachain heads, the target chain receives them.
   */
  class DevNetwork {
   public:
    DevNetwork(DevNetworkConfig config,
               std::shared_ptr<crypto::Hasher> hasher,
               std::shared_ptr<crypto::Ed25519Provider> ed25519_provider);

    /// Produces genesis blocks and connects the chains with each other
    outcome::result<void> initialize();

    /**
     * Produces a block on both chains. Parachain heads of the source chain
     * advance before the block.
     */
    outcome::result<void> produceBlocks();

    /// Sends one message to every lane of the source chain
    outcome::result<void> sendMessages();

    /// Starts block production and message generation until shutdown
    void start(std::shared_ptr<relay::RelayContext> context);

    const std::shared_ptr<DevChain> &source() const {
      return source_;
    }

    const std::shared_ptr<DevChain> &target() const {
      return target_;
    }

    const DevNetworkConfig &config() const {
      return config_;
    }

   private:
    Coro<void> produceBlocksLoop(std::shared_ptr<relay::RelayContext> context);

    Coro<void> sendMessagesLoop(std::shared_ptr<relay::RelayContext> context);

    DevNetworkConfig config_;
    std::shared_ptr<DevChain> source_;
    std::shared_ptr<DevChain> target_;
    /// Message senders of the source chain, one per lane
    std::vector<std::shared_ptr<bridge::messages::HaulBlob>> haulers_;
    uint64_t messages_sent_ = 0;
    log::Logger logger_;
  };

}  // namespace trestle::devnet
