/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

namespace trestle::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: trestle
        children:
          - name: application
          - name: crypto
          - name: grandpa
          - name: bridge
            children:
              - name: header_chain
              - name: parachains
              - name: messages
              - name: relayers
          - name: relay
            children:
              - name: finality_relay
              - name: messages_relay
              - name: parachains_relay
              - name: relay_guard
          - name: metrics
          - name: devnet
      - name: others
        children:
          - name: testing
          - name: debug
# ----------------
  )");
  }  // namespace

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : ConfiguratorFromYAML(std::move(previous), embedded_config) {}

}  // namespace trestle::log
