/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/relay_application.hpp"

#include "application/relay_configuration.hpp"
#include "crypto/ed25519_provider.hpp"
#include "crypto/hasher.hpp"
#include "devnet/dev_network.hpp"
#include "metrics/exposer.hpp"

namespace trestle::application {

  /**
   * Relays between the two development chains: finality in both directions,
   * messages of every configured lane, and parachain heads of the source
   * chain. The runtime of the target chain is guarded.
   */
  class RelayApplicationImpl final : public RelayApplication {
    template <class T>
    using sptr = std::shared_ptr<T>;

   public:
    explicit RelayApplicationImpl(RelayConfiguration configuration);

    void shutdown() override;

    relay::RelayEngine::ExitStatus run() override;

   private:
    void addTasks(relay::RelayEngine &engine);

    bool startExposer();

    RelayConfiguration configuration_;

    sptr<boost::asio::io_context> io_context_;
    sptr<crypto::Hasher> hasher_;
    sptr<crypto::Ed25519Provider> ed25519_provider_;
    sptr<relay::RelayContext> context_;
    sptr<devnet::DevNetwork> network_;
    sptr<metrics::Exposer> exposer_;

    log::Logger logger_;
  };

}  // namespace trestle::application
