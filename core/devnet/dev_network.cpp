/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/dev_network.hpp"

#include "coro/spawn.hpp"

namespace trestle::devnet {

  namespace {
    DevChainConfig chainConfig(const DevNetworkConfig &config,
                               std::string name,
                               std::string_view chain_id,
                               std::string_view bridged_chain_id,
                               primitives::RuntimeVersion runtime_version) {
      return DevChainConfig{
          .name = std::move(name),
          .chain_id = bridge::ChainId::fromSpan(
                          common::Buffer::fromString(chain_id))
                          .value(),
          .bridged_chain_id = bridge::ChainId::fromSpan(
                                  common::Buffer::fromString(bridged_chain_id))
                                  .value(),
          .authorities = config.authorities,
          .justification_period = config.justification_period,
          .authority_set_change_period = config.authority_set_change_period,
          .runtime_version = std::move(runtime_version),
          .messages = config.messages,
          .rewards = config.rewards,
      };
    }
  }  // namespace

  DevNetwork::DevNetwork(
      DevNetworkConfig config,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider)
      : config_{std::move(config)},
        source_{std::make_shared<DevChain>(
            chainConfig(config_,
                        "Rialto",
                        "rlto",
                        "mlau",
                        {.spec_name = "rialto",
                         .spec_version = 1,
                         .transaction_version = 1}),
            hasher,
            ed25519_provider)},
        target_{std::make_shared<DevChain>(
            chainConfig(config_,
                        "Millau",
                        "mlau",
                        "rlto",
                        config_.target_runtime_version),
            hasher,
            ed25519_provider)},
        logger_{log::createLogger("DevNetwork", "devnet")} {
    for (auto &lane : config_.lanes) {
      haulers_.emplace_back(std::make_shared<bridge::messages::LaneBlobHauler>(
          source_->messages(), lane));
    }
  }

  outcome::result<void> DevNetwork::initialize() {
    for (auto para_id : config_.parachains) {
      OUTCOME_TRY(head, scale::encode(para_id, primitives::BlockNumber{0}));
      OUTCOME_TRY(source_->parasRegistry()->setHead(para_id, head));
    }
    // genesis
    OUTCOME_TRY(source_->produceBlock());
    OUTCOME_TRY(target_->produceBlock());
    OUTCOME_TRY(source_init, source_->initializationData());
    OUTCOME_TRY(target_init, target_->initializationData());
    OUTCOME_TRY(target_->initializeBridge(source_init));
    OUTCOME_TRY(source_->initializeBridge(target_init));
    for (auto &lane : config_.lanes) {
      OUTCOME_TRY(source_->messages()->openLane(lane));
      OUTCOME_TRY(target_->messages()->openLane(lane));
    }
    SL_INFO(logger_,
            "Development network of {} and {} is ready, {} lanes, {} "
            "parachains",
            source_->name(),
            target_->name(),
            config_.lanes.size(),
            config_.parachains.size());
    return outcome::success();
  }

  outcome::result<void> DevNetwork::produceBlocks() {
    auto number = source_->bestNumber() + 1;
    for (auto para_id : config_.parachains) {
      OUTCOME_TRY(head, scale::encode(para_id, number));
      OUTCOME_TRY(source_->parasRegistry()->setHead(para_id, head));
    }
    auto max_pruned = config_.messages.max_messages_in_proof;
    OUTCOME_TRY(source_->messages()->onIdle(max_pruned));
    OUTCOME_TRY(target_->messages()->onIdle(max_pruned));
    OUTCOME_TRY(source_->produceBlock());
    OUTCOME_TRY(target_block, target_->produceBlock());

    if (config_.target_runtime_upgrade_at
        and target_block.header.number == *config_.target_runtime_upgrade_at) {
      auto version = target_->runtimeVersion();
      ++version.spec_version;
      target_->setRuntimeVersion(std::move(version));
    }
    return outcome::success();
  }

  outcome::result<void> DevNetwork::sendMessages() {
    for (auto &hauler : haulers_) {
      auto payload = common::Buffer::fromString(fmt::format(
          "message #{} from {}", ++messages_sent_, source_->name()));
      OUTCOME_TRY(hauler->haulBlob(std::move(payload)));
    }
    SL_DEBUG(logger_,
             "Sent {} messages, {} in total",
             haulers_.size(),
             messages_sent_);
    return outcome::success();
  }

  void DevNetwork::start(std::shared_ptr<relay::RelayContext> context) {
    auto executor = context->io().get_executor();
    coroSpawn(executor, [this, context]() -> Coro<void> {
      co_await produceBlocksLoop(context);
    });
    if (config_.message_interval.count() != 0 and not config_.lanes.empty()) {
      coroSpawn(executor, [this, context]() -> Coro<void> {
        co_await sendMessagesLoop(context);
      });
    }
  }

  Coro<void> DevNetwork::produceBlocksLoop(
      std::shared_ptr<relay::RelayContext> context) {
    while (co_await context->sleep(config_.block_time)) {
      if (auto produced = produceBlocks(); not produced) {
        SL_ERROR(logger_, "Failed to produce blocks: {}", produced.error());
      }
    }
  }

  Coro<void> DevNetwork::sendMessagesLoop(
      std::shared_ptr<relay::RelayContext> context) {
    while (co_await context->sleep(config_.message_interval)) {
      if (auto sent = sendMessages(); not sent) {
        // queue is full or the lane is closing, the relay catches up later
        SL_WARN(logger_, "Failed to send messages: {}", sent.error());
      }
    }
  }

}  // namespace trestle::devnet
