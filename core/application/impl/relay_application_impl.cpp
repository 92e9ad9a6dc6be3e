/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/relay_application_impl.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "consensus/grandpa/justification_verifier.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "devnet/dev_clients.hpp"
#include "metrics/impl/exposer_impl.hpp"
#include "metrics/impl/prometheus/handler_impl.hpp"
#include "metrics/impl/prometheus/registry_impl.hpp"
#include "relay/finality_loop.hpp"
#include "relay/message_lane_loop.hpp"
#include "relay/parachains_loop.hpp"
#include "relay/runtime_version_guard.hpp"

namespace trestle::application {

  RelayApplicationImpl::RelayApplicationImpl(RelayConfiguration configuration)
      : configuration_{std::move(configuration)},
        io_context_{std::make_shared<boost::asio::io_context>()},
        hasher_{std::make_shared<crypto::HasherImpl>()},
        ed25519_provider_{std::make_shared<crypto::Ed25519ProviderImpl>()},
        context_{std::make_shared<relay::RelayContext>(io_context_)},
        network_{std::make_shared<devnet::DevNetwork>(
            configuration_.devnet, hasher_, ed25519_provider_)},
        logger_{log::createLogger("RelayApplication", "application")} {}

  void RelayApplicationImpl::shutdown() {
    boost::asio::post(*io_context_,
                      [context{context_}] { context->requestShutdown(); });
  }

  relay::RelayEngine::ExitStatus RelayApplicationImpl::run() {
    if (auto res = network_->initialize(); res.has_error()) {
      SL_CRITICAL(logger_, "Failed to initialize chains: {}", res.error());
      return relay::RelayEngine::ExitStatus::FATAL;
    }

    if (configuration_.openmetrics_http_endpoint.has_value()
        and not startExposer()) {
      return relay::RelayEngine::ExitStatus::FATAL;
    }

    boost::asio::signal_set signals{*io_context_, SIGINT, SIGTERM};
    signals.async_wait(
        [this](const boost::system::error_code &ec, int signal_number) {
          if (ec) {
            return;
          }
          SL_INFO(logger_, "Signal {} received, stopping", signal_number);
          context_->requestShutdown();
        });
    context_->onShutdown([&signals] {
      boost::system::error_code ec;
      signals.cancel(ec);
    });

    relay::RelayEngine engine{context_, configuration_.timings};
    addTasks(engine);
    network_->start(context_);

    SL_INFO(logger_,
            "Relaying between {} and {}",
            network_->source()->name(),
            network_->target()->name());

    auto status = engine.run();

    if (exposer_) {
      exposer_->stop();
    }
    return status;
  }

  void RelayApplicationImpl::addTasks(relay::RelayEngine &engine) {
    const auto &source = network_->source();
    const auto &target = network_->target();
    auto verifier = std::make_shared<consensus::grandpa::JustificationVerifier>(
        ed25519_provider_, hasher_);

    auto finality = [&](const sptr<devnet::DevChain> &from,
                        const sptr<devnet::DevChain> &to) {
      engine.addTask(std::make_shared<relay::FinalityLoop>(
          fmt::format("{}-to-{}-headers", from->name(), to->name()),
          std::make_shared<devnet::DevFinalitySourceClient>(from),
          std::make_shared<devnet::DevFinalityTargetClient>(to),
          verifier,
          hasher_,
          configuration_.timings));
    };
    finality(source, target);
    finality(target, source);

    auto messages_source =
        std::make_shared<devnet::DevMessagesSourceClient>(source);
    auto messages_target =
        std::make_shared<devnet::DevMessagesTargetClient>(target);
    for (const auto &lane : configuration_.lanes) {
      engine.addTask(std::make_shared<relay::MessageDeliveryRace>(
          fmt::format("lane-{}-delivery", lane.lane.toHex()),
          messages_source,
          messages_target,
          lane));
      engine.addTask(std::make_shared<relay::MessageConfirmationRace>(
          fmt::format("lane-{}-confirmation", lane.lane.toHex()),
          messages_source,
          messages_target,
          lane));
    }

    if (not configuration_.parachains.para_ids.empty()) {
      engine.addTask(std::make_shared<relay::ParachainsLoop>(
          fmt::format("{}-to-{}-parachains", source->name(), target->name()),
          std::make_shared<devnet::DevParachainsSourceClient>(source),
          std::make_shared<devnet::DevParachainsTargetClient>(target),
          hasher_,
          configuration_.parachains));
    }

    engine.addTask(std::make_shared<relay::RuntimeVersionGuard>(
        fmt::format("{}-runtime-guard", target->name()),
        std::make_shared<devnet::DevRuntimeVersionClient>(target),
        context_,
        configuration_.runtime_guard));
  }

  bool RelayApplicationImpl::startExposer() {
    auto handler = std::make_shared<metrics::PrometheusHandler>(
        *metrics::PrometheusRegistry::prometheusRegistry());
    metrics::createRegistry()->setHandler(*handler);

    auto exposer = std::make_shared<metrics::ExposerImpl>(
        metrics::Exposer::Configuration{
            configuration_.openmetrics_http_endpoint.value()},
        metrics::Session::Configuration{});
    exposer->setHandler(handler);
    if (not exposer->prepare() or not exposer->start()) {
      return false;
    }
    exposer_ = std::move(exposer);
    return true;
  }

}  // namespace trestle::application
