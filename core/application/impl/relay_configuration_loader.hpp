/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/relay_configuration.hpp"
#include "log/logger.hpp"

namespace trestle::application {

  // clang-format off
  /**
   * Reads relay configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE (INI)
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on
  class RelayConfigurationLoader {
   public:
    RelayConfigurationLoader();

    /**
     * Fills the configuration, prints usage on `--help`
     * @return false if the relay must not be started
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const RelayConfiguration &configuration() const {
      return configuration_;
    }

   private:
    log::Logger logger_;
    RelayConfiguration configuration_;
  };

}  // namespace trestle::application
