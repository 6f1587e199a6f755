#include <variant> // std::{get, holds_alternative}

#include <TDC/Core/Rules.hpp>

#include <TDC/Utils/Error.hpp>
#include <TDC/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace tdc::core::rules;
using tdc::utils::types::Result;
using enum tdc::utils::error::TdcErrorCode;

class RulesTest : public testing::Test {};

TEST_F(RulesTest, RuleFileNames) {
  EXPECT_EQ(GetRuleFileName(Category::Device), "device_identifiers.json");
  EXPECT_EQ(GetRuleFileName(Category::Driver), "driver_identifiers.json");
  EXPECT_EQ(GetRuleFileName(Category::DriverPackage), "driver_package_identifiers.json");
}

TEST_F(RulesTest, ParseDeviceRules) {
  Result<RuleSet> rules = ParseRuleSet(Category::Device, R"([
    {
      "friendlyName": "Huion Tablet",
      "deviceDescription": null,
      "manufacturerName": "Huion",
      "hardwareId": "VID_256C",
      "classGuid": "{745a17a0-74d3-11d0-b6fe-00a0c90f57da}"
    },
    { "friendlyName": "Anything" }
  ])");

  ASSERT_TRUE(rules);
  ASSERT_EQ(rules->size(), 2U);
  ASSERT_TRUE(std::holds_alternative<DeviceRule>(rules->front()));

  const auto& first = std::get<DeviceRule>(rules->front());

  EXPECT_EQ(first.friendlyName, "Huion Tablet");
  EXPECT_FALSE(first.deviceDescription.has_value());
  EXPECT_EQ(first.manufacturerName, "Huion");
  EXPECT_EQ(first.hardwareId, "VID_256C");
  EXPECT_EQ(first.classGuid, "{745a17a0-74d3-11d0-b6fe-00a0c90f57da}");

  const auto& second = std::get<DeviceRule>(rules->back());

  EXPECT_EQ(GetLabel(rules->back()), "Anything");
  EXPECT_FALSE(second.manufacturerName.has_value());
  EXPECT_FALSE(second.classGuid.has_value());
}

TEST_F(RulesTest, ParseDriverRules) {
  Result<RuleSet> rules = ParseRuleSet(Category::Driver, R"([
    { "friendlyName": "Gaomon", "originalName": "gaomon.*\\.inf", "providerName": "Gaomon" }
  ])");

  ASSERT_TRUE(rules);
  ASSERT_EQ(rules->size(), 1U);

  const auto& rule = std::get<DriverRule>(rules->front());

  EXPECT_EQ(rule.originalName, R"(gaomon.*\.inf)");
  EXPECT_EQ(rule.providerName, "Gaomon");
}

TEST_F(RulesTest, ParseDriverPackageUninstallMethods) {
  Result<RuleSet> rules = ParseRuleSet(Category::DriverPackage, R"([
    { "friendlyName": "A", "displayName": "A" },
    { "friendlyName": "B", "displayName": "B", "uninstallMethod": "normal" },
    { "friendlyName": "C", "displayName": "C", "uninstallMethod": "deferred" },
    { "friendlyName": "D", "displayName": "D", "uninstallMethod": "registry_only" }
  ])");

  ASSERT_TRUE(rules);
  ASSERT_EQ(rules->size(), 4U);

  EXPECT_EQ(std::get<DriverPackageRule>((*rules)[0]).uninstallMethod, UninstallMethod::Normal);
  EXPECT_EQ(std::get<DriverPackageRule>((*rules)[1]).uninstallMethod, UninstallMethod::Normal);
  EXPECT_EQ(std::get<DriverPackageRule>((*rules)[2]).uninstallMethod, UninstallMethod::Deferred);
  EXPECT_EQ(std::get<DriverPackageRule>((*rules)[3]).uninstallMethod, UninstallMethod::RegistryOnly);
}

TEST_F(RulesTest, EmptyFileGivesEmptyRuleSet) {
  Result<RuleSet> rules = ParseRuleSet(Category::Device, "[]");

  ASSERT_TRUE(rules);
  EXPECT_TRUE(rules->empty());
}

TEST_F(RulesTest, UnknownKeyIsAConfigurationError) {
  Result<RuleSet> rules = ParseRuleSet(Category::Driver, R"([{ "friendlyName": "X", "displayName": "X" }])");

  ASSERT_FALSE(rules);
  EXPECT_EQ(rules.error().code, ConfigurationError);
  EXPECT_NE(rules.error().message.find("driver_identifiers.json"), tdc::utils::types::String::npos);
}

TEST_F(RulesTest, UnknownUninstallMethodIsAConfigurationError) {
  Result<RuleSet> rules = ParseRuleSet(Category::DriverPackage, R"([{ "friendlyName": "X", "uninstallMethod": "magic" }])");

  ASSERT_FALSE(rules);
  EXPECT_EQ(rules.error().code, ConfigurationError);
}

TEST_F(RulesTest, MalformedJsonIsAConfigurationError) {
  Result<RuleSet> rules = ParseRuleSet(Category::Device, R"([{ "friendlyName": )");

  ASSERT_FALSE(rules);
  EXPECT_EQ(rules.error().code, ConfigurationError);
}
