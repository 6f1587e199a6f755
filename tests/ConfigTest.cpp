#include <toml++/toml.h> // toml::{parse_result, parse}

#include <TDC/Utils/Logging.hpp>

#include "Config/Config.hpp"

#include "gtest/gtest.h"

using tdc::config::Cleanup;
using tdc::config::Config;
using tdc::config::General;
using tdc::utils::logging::LogLevel;

class ConfigTest : public testing::Test {};

TEST_F(ConfigTest, GeneralFromToml_LogLevel) {
  toml::parse_result tbl = toml::parse(R"(
    log_level = "Debug"
  )");

  ASSERT_TRUE(tbl.is_table());
  General generalConfig = General::fromToml(*tbl.as_table());
  EXPECT_EQ(generalConfig.logLevel, LogLevel::Debug);
}

TEST_F(ConfigTest, GeneralFromToml_InvalidLogLevelIsIgnored) {
  toml::parse_result tbl = toml::parse(R"(
    log_level = "chatty"
  )");

  ASSERT_TRUE(tbl.is_table());
  General generalConfig = General::fromToml(*tbl.as_table());
  EXPECT_FALSE(generalConfig.logLevel.has_value());
}

TEST_F(ConfigTest, CleanupFromToml_Defaults) {
  toml::parse_result tbl = toml::parse(R"(
    # Nothing set
  )");

  ASSERT_TRUE(tbl.is_table());
  Cleanup cleanupConfig = Cleanup::fromToml(*tbl.as_table());
  EXPECT_FALSE(cleanupConfig.dryRun);
  EXPECT_TRUE(cleanupConfig.prompt);
  EXPECT_TRUE(cleanupConfig.useCache);
  EXPECT_TRUE(cleanupConfig.checkUpdates);
  EXPECT_TRUE(cleanupConfig.disabledModules.empty());
}

TEST_F(ConfigTest, CleanupFromToml_AllSet) {
  toml::parse_result tbl = toml::parse(R"(
    dry_run = true
    prompt = false
    use_cache = false
    check_updates = false
    disabled_modules = ["device-cleanup", 42, "driver-cleanup"]
  )");

  ASSERT_TRUE(tbl.is_table());
  Cleanup cleanupConfig = Cleanup::fromToml(*tbl.as_table());
  EXPECT_TRUE(cleanupConfig.dryRun);
  EXPECT_FALSE(cleanupConfig.prompt);
  EXPECT_FALSE(cleanupConfig.useCache);
  EXPECT_FALSE(cleanupConfig.checkUpdates);
  ASSERT_EQ(cleanupConfig.disabledModules.size(), 2U);
  EXPECT_TRUE(cleanupConfig.isDisabled("device-cleanup"));
  EXPECT_TRUE(cleanupConfig.isDisabled("driver-cleanup"));
  EXPECT_FALSE(cleanupConfig.isDisabled("driver-package-cleanup"));
}

TEST_F(ConfigTest, CleanupFromToml_WrongTypeFallsBackToDefault) {
  toml::parse_result tbl = toml::parse(R"(
    prompt = "no"
  )");

  ASSERT_TRUE(tbl.is_table());
  Cleanup cleanupConfig = Cleanup::fromToml(*tbl.as_table());
  EXPECT_TRUE(cleanupConfig.prompt);
}

TEST_F(ConfigTest, ConfigFromToml_Sections) {
  toml::parse_result tbl = toml::parse(R"(
    [general]
    log_level = "warn"

    [cleanup]
    dry_run = true
  )");

  ASSERT_TRUE(tbl.is_table());
  Config config(*tbl.as_table());
  EXPECT_EQ(config.general.logLevel, LogLevel::Warn);
  EXPECT_TRUE(config.cleanup.dryRun);
  EXPECT_TRUE(config.cleanup.prompt);
}

TEST_F(ConfigTest, ConfigFromToml_MissingSectionsUseDefaults) {
  toml::parse_result tbl = toml::parse(R"(
    general = 5
  )");

  ASSERT_TRUE(tbl.is_table());
  Config config(*tbl.as_table());
  EXPECT_FALSE(config.general.logLevel.has_value());
  EXPECT_FALSE(config.cleanup.dryRun);
  EXPECT_TRUE(config.cleanup.checkUpdates);
}
