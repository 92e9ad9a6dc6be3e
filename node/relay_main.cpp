/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <soralog/util.hpp>

#include "application/impl/relay_application_impl.hpp"
#include "application/impl/relay_configuration_loader.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using trestle::application::RelayApplicationImpl;
using trestle::application::RelayConfigurationLoader;
using trestle::relay::RelayEngine;

namespace {
  int run_relay(int argc, const char **argv) {
    RelayConfigurationLoader loader;
    if (not loader.initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    trestle::log::tuneLoggingSystem(loader.configuration().log);

    auto logger =
        trestle::log::createLogger("Main", trestle::log::defaultGroupName);

    auto app = std::make_shared<RelayApplicationImpl>(loader.configuration());

    SL_INFO(logger, "Trestle relay started");

    auto status = app->run();

    if (status == RelayEngine::ExitStatus::FATAL) {
      SL_CRITICAL(logger, "Trestle relay stopped with the fatal outcome");
      logger->flush();
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Trestle relay stopped");
    logger->flush();
    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("trestle");

  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      std::make_shared<trestle::log::Configurator>());

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  trestle::log::setLoggingSystem(logging_system);

  return run_relay(argc, argv);
}
