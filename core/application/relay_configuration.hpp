/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include "devnet/dev_network.hpp"
#include "relay/relay_config.hpp"

namespace trestle::application {

  /**
   * Everything the relay process is started with
   */
  struct RelayConfiguration {
    relay::RelayTimings timings;
    /// One delivery and one confirmation task per lane
    std::vector<relay::MessageLaneParams> lanes;
    relay::ParachainsParams parachains;
    relay::RuntimeGuardParams runtime_guard;
    /// OpenMetrics endpoint, metrics are not served if empty
    std::optional<boost::asio::ip::tcp::endpoint> openmetrics_http_endpoint;
    /// Logging filters in `group=level` form
    std::vector<std::string> log;
    devnet::DevNetworkConfig devnet;
  };

}  // namespace trestle::application
