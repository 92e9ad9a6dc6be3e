/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/relay_configuration_loader.hpp"

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using trestle::application::RelayConfigurationLoader;

class RelayConfigurationLoaderTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  bool load(std::vector<const char *> args) {
    args.insert(args.begin(), "trestle_relay");
    return loader_.initializeFromArgs(static_cast<int>(args.size()),
                                      args.data());
  }

  const trestle::application::RelayConfiguration &config() const {
    return loader_.configuration();
  }

  RelayConfigurationLoader loader_;
};

/**
 * @given no arguments
 * @when loading the configuration
 * @then defaults are used
 */
TEST_F(RelayConfigurationLoaderTest, Defaults) {
  ASSERT_TRUE(load({}));
  EXPECT_EQ(config().timings.tick_interval, 1000ms);
  EXPECT_EQ(config().timings.stall_timeout, 30000ms);
  EXPECT_EQ(config().timings.max_headers_per_tick, 128);
  EXPECT_TRUE(config().lanes.empty());
  EXPECT_TRUE(config().parachains.para_ids.empty());
  EXPECT_FALSE(config().runtime_guard.expected_spec_version.has_value());
  EXPECT_FALSE(config().openmetrics_http_endpoint.has_value());
  EXPECT_EQ(config().devnet.authorities, 4);
}

/**
 * @given lanes, parachains and a relayer account
 * @when loading the configuration
 * @then every lane gets the relay parameters and the development network
 * serves the same lanes and parachains
 */
TEST_F(RelayConfigurationLoaderTest, LanesAndParachains) {
  auto relayer = "0x" + std::string(64, '1');
  ASSERT_TRUE(load({"--lane",
                    "0x00000001",
                    "00000002",
                    "--relayer",
                    relayer.c_str(),
                    "--max-messages-in-tx",
                    "8",
                    "--parachain",
                    "1000",
                    "2000",
                    "--expected-spec-version",
                    "5"}));
  ASSERT_EQ(config().lanes.size(), 2);
  EXPECT_EQ(config().lanes[0].lane[3], 1);
  EXPECT_EQ(config().lanes[1].lane[3], 2);
  for (auto &lane : config().lanes) {
    EXPECT_EQ(lane.max_messages_in_tx, 8);
    EXPECT_EQ(lane.relayer[0], 0x11);
    EXPECT_EQ(lane.relayer[31], 0x11);
  }
  EXPECT_EQ(config().devnet.lanes.size(), 2);
  EXPECT_EQ(config().parachains.para_ids, (std::vector<uint32_t>{1000, 2000}));
  EXPECT_EQ(config().devnet.parachains, config().parachains.para_ids);
  EXPECT_EQ(config().runtime_guard.expected_spec_version, 5);
}

/**
 * @given invalid values
 * @when loading the configuration
 * @then the relay must not be started
 */
TEST_F(RelayConfigurationLoaderTest, RejectsInvalidValues) {
  EXPECT_FALSE(load({"--lane", "0x0001"}));
  EXPECT_FALSE(RelayConfigurationLoader{}.initializeFromArgs(
      3, std::vector<const char *>{"r", "--tick-interval", "0"}.data()));
  EXPECT_FALSE(RelayConfigurationLoader{}.initializeFromArgs(
      3, std::vector<const char *>{"r", "--max-headers-per-tick", "0"}.data()));
  EXPECT_FALSE(RelayConfigurationLoader{}.initializeFromArgs(
      3, std::vector<const char *>{"r", "--max-messages-in-tx", "0"}.data()));
  EXPECT_FALSE(RelayConfigurationLoader{}.initializeFromArgs(
      3, std::vector<const char *>{"r", "--relayer", "0xzz"}.data()));
  EXPECT_FALSE(RelayConfigurationLoader{}.initializeFromArgs(
      2, std::vector<const char *>{"r", "--no-such-option"}.data()));
}

/**
 * @given a prometheus port
 * @when loading the configuration
 * @then metrics are served on the local host
 */
TEST_F(RelayConfigurationLoaderTest, OpenMetricsEndpoint) {
  ASSERT_TRUE(load({"--prometheus-port", "9615"}));
  ASSERT_TRUE(config().openmetrics_http_endpoint.has_value());
  EXPECT_EQ(config().openmetrics_http_endpoint->port(), 9615);
  EXPECT_EQ(config().openmetrics_http_endpoint->address().to_string(),
            "127.0.0.1");
}

/**
 * @given a configuration file and a command line overriding one option
 * @when loading the configuration
 * @then the command line wins and the rest comes from the file
 */
TEST_F(RelayConfigurationLoaderTest, ConfigFile) {
  auto path = std::filesystem::temp_directory_path()
            / "trestle_relay_configuration_test.ini";
  {
    std::ofstream file{path};
    file << "tick-interval=250\n"
         << "dev-block-time=500\n"
         << "log=relay=debug\n";
  }
  auto path_str = path.string();
  ASSERT_TRUE(load(
      {"--config-file", path_str.c_str(), "--tick-interval", "100"}));
  std::filesystem::remove(path);

  EXPECT_EQ(config().timings.tick_interval, 100ms);
  EXPECT_EQ(config().devnet.block_time, 500ms);
  EXPECT_EQ(config().log, std::vector<std::string>{"relay=debug"});
}

/**
 * @given a missing configuration file
 * @when loading the configuration
 * @then the relay must not be started
 */
TEST_F(RelayConfigurationLoaderTest, MissingConfigFile) {
  EXPECT_FALSE(load({"--config-file", "/nonexistent/trestle.ini"}));
}
