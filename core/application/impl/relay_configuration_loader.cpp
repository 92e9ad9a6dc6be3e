/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/relay_configuration_loader.hpp"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include "common/hexutil.hpp"

namespace {
  namespace po = boost::program_options;
  using trestle::application::RelayConfiguration;

  template <typename T, typename Func>
  void find_argument(po::variables_map &vm, const char *name, Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(po::variables_map &vm, const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  /// Accepts hex with or without the 0x prefix
  template <typename T>
  trestle::outcome::result<T> blobFromHex(std::string_view hex) {
    if (hex.starts_with("0x")) {
      hex.remove_prefix(2);
    }
    return T::fromHex(hex);
  }

  const std::string def_openmetrics_http_host = "127.0.0.1";
  // account of the relayer, public key of the dev seed `//Relayer`
  const std::string def_relayer =
      "0x8eaf04151687736326c9fea17e25fc5287613693c912909cb226aa4794f26a48";
}  // namespace

namespace trestle::application {

  RelayConfigurationLoader::RelayConfigurationLoader()
      : logger_{log::createLogger("RelayConfiguration", "application")} {}

  bool RelayConfigurationLoader::initializeFromArgs(int argc,
                                                    const char **argv) {
    auto &cfg = configuration_;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lrelay=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off.\n"
          "The global log level can be set with -l<level>.")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from (INI syntax, options without dashes).")
        ;

    po::options_description relay_desc("Relay options");
    relay_desc.add_options()
        ("tick-interval", po::value<uint32_t>(), "delay between two polls of the chains, ms")
        ("stall-timeout", po::value<uint32_t>(), "delay after which a not imported header is resubmitted, ms")
        ("backoff-initial", po::value<uint32_t>(), "first delay before reconnection, ms")
        ("backoff-max", po::value<uint32_t>(), "max delay before reconnection, ms")
        ("max-headers-per-tick", po::value<uint32_t>(), "source headers read by one finality tick at most")
        ("lane", po::value<std::vector<std::string>>()->multitoken(), "hex id of the 4 bytes lane to relay, may be repeated")
        ("relayer", po::value<std::string>()->default_value(def_relayer), "hex account which signs transactions and gets rewards")
        ("max-messages-in-tx", po::value<uint64_t>(), "max messages delivered by one transaction")
        ("parachain", po::value<std::vector<uint32_t>>()->multitoken(), "id of the parachain to relay heads of, may be repeated")
        ("expected-spec-version", po::value<uint32_t>(), "spec version of the target runtime; the first seen one if not set")
        ;

    po::options_description metrics_desc("Metrics options");
    metrics_desc.add_options()
        ("prometheus-host", po::value<std::string>(), "address for OpenMetrics over HTTP")
        ("prometheus-port", po::value<uint16_t>(), "port for OpenMetrics over HTTP, metrics are disabled if not set")
        ;

    po::options_description dev_desc("Development network options");
    dev_desc.add_options()
        ("dev-block-time", po::value<uint32_t>(), "block time of both chains, ms")
        ("dev-message-interval", po::value<uint32_t>(), "period of sending messages to every lane, ms; 0 disables")
        ("dev-authorities", po::value<uint32_t>(), "number of GRANDPA authorities of every chain")
        ("dev-justification-period", po::value<uint32_t>(), "every n-th block has a justification")
        ("dev-authority-set-change-period", po::value<uint32_t>(), "authority set is changed every n blocks; 0 disables")
        ("dev-runtime-upgrade-at", po::value<uint32_t>(), "target runtime is upgraded at this block")
        ;
    // clang-format on

    desc.add(relay_desc).add(metrics_desc).add(dev_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      if (vm.count("help") > 0) {
        std::cout << desc << std::endl;
        return false;
      }
      if (auto it = vm.find("config-file"); it != vm.end()) {
        auto path = it->second.as<std::string>();
        std::ifstream file{path};
        if (not file.is_open()) {
          SL_ERROR(logger_, "Can't open config file {}", path);
          return false;
        }
        // options from the command line are already stored and stay
        po::store(po::parse_config_file(file, desc), vm);
      }
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) { cfg.log = val; });

    auto millis = [](uint32_t val) { return std::chrono::milliseconds{val}; };
    find_argument<uint32_t>(vm, "tick-interval", [&](uint32_t val) {
      cfg.timings.tick_interval = millis(val);
    });
    find_argument<uint32_t>(vm, "stall-timeout", [&](uint32_t val) {
      cfg.timings.stall_timeout = millis(val);
    });
    find_argument<uint32_t>(vm, "backoff-initial", [&](uint32_t val) {
      cfg.timings.backoff_initial = millis(val);
    });
    find_argument<uint32_t>(vm, "backoff-max", [&](uint32_t val) {
      cfg.timings.backoff_max = millis(val);
    });
    find_argument<uint32_t>(vm, "max-headers-per-tick", [&](uint32_t val) {
      cfg.timings.max_headers_per_tick = val;
    });
    if (cfg.timings.tick_interval.count() == 0) {
      SL_ERROR(logger_, "Tick interval must not be zero");
      return false;
    }
    if (cfg.timings.max_headers_per_tick == 0) {
      SL_ERROR(logger_, "Max headers per tick must not be zero");
      return false;
    }

    auto relayer =
        blobFromHex<bridge::AccountId>(vm["relayer"].as<std::string>());
    if (relayer.has_error()) {
      SL_ERROR(logger_, "Invalid relayer account: {}", relayer.error());
      return false;
    }

    relay::MessageLaneParams lane_defaults;
    find_argument<uint64_t>(vm, "max-messages-in-tx", [&](uint64_t val) {
      lane_defaults.max_messages_in_tx = val;
    });
    lane_defaults.relayer = relayer.value();
    lane_defaults.max_unrewarded_relayer_entries =
        cfg.devnet.messages.max_unrewarded_relayer_entries;
    lane_defaults.max_unconfirmed_messages =
        cfg.devnet.messages.max_unconfirmed_messages;
    if (lane_defaults.max_messages_in_tx == 0
        or lane_defaults.max_messages_in_tx
               > cfg.devnet.messages.max_messages_in_proof) {
      SL_ERROR(logger_,
               "Max messages in transaction must be in 1..={}",
               cfg.devnet.messages.max_messages_in_proof);
      return false;
    }

    bool lanes_ok = true;
    find_argument<std::vector<std::string>>(
        vm, "lane", [&](const std::vector<std::string> &lanes) {
          for (auto &hex : lanes) {
            auto lane = blobFromHex<bridge::messages::LaneId>(hex);
            if (lane.has_error()) {
              SL_ERROR(logger_, "Invalid lane id '{}': {}", hex, lane.error());
              lanes_ok = false;
              return;
            }
            auto params = lane_defaults;
            params.lane = lane.value();
            cfg.lanes.emplace_back(params);
            cfg.devnet.lanes.emplace_back(lane.value());
          }
        });
    if (not lanes_ok) {
      return false;
    }

    find_argument<std::vector<uint32_t>>(
        vm, "parachain", [&](const std::vector<uint32_t> &ids) {
          cfg.parachains.para_ids = ids;
          cfg.devnet.parachains = ids;
        });
    find_argument<uint32_t>(vm, "expected-spec-version", [&](uint32_t val) {
      cfg.runtime_guard.expected_spec_version = val;
    });

    if (find_argument(vm, "prometheus-port")) {
      auto host = def_openmetrics_http_host;
      find_argument<std::string>(
          vm, "prometheus-host", [&](const std::string &val) { host = val; });
      boost::system::error_code ec;
      auto address = boost::asio::ip::make_address(host, ec);
      if (ec) {
        SL_ERROR(logger_,
                 "Invalid prometheus host '{}': {}",
                 host,
                 ec.message());
        return false;
      }
      cfg.openmetrics_http_endpoint = boost::asio::ip::tcp::endpoint{
          address, vm["prometheus-port"].as<uint16_t>()};
    }

    find_argument<uint32_t>(vm, "dev-block-time", [&](uint32_t val) {
      cfg.devnet.block_time = millis(val);
    });
    find_argument<uint32_t>(vm, "dev-message-interval", [&](uint32_t val) {
      cfg.devnet.message_interval = millis(val);
    });
    find_argument<uint32_t>(vm, "dev-authorities", [&](uint32_t val) {
      cfg.devnet.authorities = val;
    });
    find_argument<uint32_t>(vm, "dev-justification-period", [&](uint32_t val) {
      cfg.devnet.justification_period = val;
    });
    find_argument<uint32_t>(
        vm, "dev-authority-set-change-period", [&](uint32_t val) {
          cfg.devnet.authority_set_change_period = val;
        });
    find_argument<uint32_t>(vm, "dev-runtime-upgrade-at", [&](uint32_t val) {
      cfg.devnet.target_runtime_upgrade_at = val;
    });
    if (cfg.devnet.block_time.count() == 0 or cfg.devnet.authorities == 0) {
      SL_ERROR(logger_,
               "Block time and number of authorities must be positive");
      return false;
    }

    SL_DEBUG(logger_,
             "Relaying {} lanes and {} parachains, tick {} ms",
             cfg.lanes.size(),
             cfg.parachains.para_ids.size(),
             cfg.timings.tick_interval.count());
    return true;
  }

}  // namespace trestle::application
