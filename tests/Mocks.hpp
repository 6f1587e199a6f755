#pragma once

#include <stop_token> // std::stop_token

#include <TDC/Core/Console.hpp>
#include <TDC/Core/Host.hpp>
#include <TDC/Core/Inventory.hpp>
#include <TDC/Core/Rules.hpp>

#include <TDC/Utils/Error.hpp>
#include <TDC/Utils/Types.hpp>

#include "gmock/gmock.h"

namespace tdc::testing {
  using utils::types::Option;
  using utils::types::Result;
  using utils::types::String;
  using utils::types::StringView;
  using utils::types::Vec;

  // NOLINTBEGIN(readability-identifier-naming)
  class MockInventoryProvider : public core::inventory::IInventoryProvider {
   public:
    MOCK_METHOD(Result<Vec<core::inventory::Device>>, enumerateDevices, (), (const, override));
    MOCK_METHOD(Result<Vec<core::inventory::Driver>>, enumerateDrivers, (), (const, override));
    MOCK_METHOD(Result<Vec<core::inventory::DriverPackage>>, enumerateDriverPackages, (), (const, override));
  };

  class MockHost : public core::host::IHost {
   public:
    MOCK_METHOD(Result<core::host::RemovalOutcome>, removeDevice, (const core::inventory::Device&), (override));
    MOCK_METHOD(Result<core::host::RemovalOutcome>, removeDriver, (const core::inventory::Driver&), (override));
    MOCK_METHOD(Result<>, deleteUninstallEntry, (const core::inventory::DriverPackage&), (override));
    MOCK_METHOD(Result<core::host::ProcessId>, launchProcess, (const String&, const Option<String>&), (override));
    MOCK_METHOD(Result<Vec<core::host::ProcessId>>, childProcesses, (core::host::ProcessId), (override));
    MOCK_METHOD(Result<Vec<core::host::ProcessEntry>>, processList, (), (override));
    MOCK_METHOD(Result<>, waitForExit, (core::host::ProcessId, std::stop_token), (override));
    MOCK_METHOD(core::host::ProcessId, currentProcessId, (), (const, override));
    MOCK_METHOD(Result<bool>, isElevated, (), (const, override));
    MOCK_METHOD(Result<>, reboot, (), (override));
  };

  class MockConsole : public core::console::IConsole {
   public:
    MOCK_METHOD(core::console::PromptResult, confirm, (StringView), (override));
    MOCK_METHOD(Option<char>, waitForKey, (std::stop_token), (override));
  };

  class MockRuleSetProvider : public core::rules::IRuleSetProvider {
   public:
    MOCK_METHOD(Result<core::rules::RuleSet>, resolve, (core::rules::Category), (override));
  };
  // NOLINTEND(readability-identifier-naming)
} // namespace tdc::testing
