#include <chrono>     // std::chrono_literals
#include <filesystem> // std::filesystem::{path, temp_directory_path, remove_all, exists, file_size}
#include <format>     // std::format
#include <fstream>    // std::ifstream
#include <iterator>   // std::istreambuf_iterator

#include <TDC/Core/Cleanup.hpp>
#include <TDC/Core/Console.hpp>
#include <TDC/Core/Host.hpp>
#include <TDC/Core/Inventory.hpp>
#include <TDC/Core/Rules.hpp>
#include <TDC/Services/Uninstaller.hpp>

#include <TDC/Utils/Error.hpp>
#include <TDC/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Mocks.hpp"

using namespace testing;
using namespace std::chrono_literals;
using namespace tdc::utils::types;

using tdc::core::cleanup::CleanupOrchestrator;
using tdc::core::cleanup::GetModuleInfo;
using tdc::core::cleanup::ModuleRunInfo;
using tdc::core::cleanup::RunState;
using tdc::core::console::PromptResult;
using tdc::core::host::RemovalOutcome;
using tdc::core::inventory::Device;
using tdc::core::inventory::Driver;
using tdc::core::inventory::DriverPackage;
using tdc::core::rules::Category;
using tdc::core::rules::DeviceRule;
using tdc::core::rules::DriverPackageRule;
using tdc::core::rules::DriverRule;
using tdc::core::rules::RuleSet;
using tdc::core::rules::UninstallMethod;
using tdc::services::uninstaller::TrackerOptions;
using tdc::services::uninstaller::UninstallTracker;
using tdc::testing::MockConsole;
using tdc::testing::MockHost;
using tdc::testing::MockInventoryProvider;
using tdc::testing::MockRuleSetProvider;
using tdc::utils::error::TdcError;
using enum tdc::utils::error::TdcErrorCode;

namespace fs = std::filesystem;

namespace {
  fn MakeDevice(String instanceId, String manufacturer) -> Device {
    Device device;
    device.instanceId   = std::move(instanceId);
    device.manufacturer = std::move(manufacturer);
    device.classGuid    = "{745a17a0-74d3-11d0-b6fe-00a0c90f57da}";
    return device;
  }

  fn DeviceInstance(const StringView instanceId) -> Matcher<const Device&> {
    return Field(&Device::instanceId, String(instanceId));
  }

  fn Removed(const bool rebootRequired) -> Result<RemovalOutcome> {
    return RemovalOutcome { .rebootRequired = rebootRequired };
  }
} // namespace

class CleanupTest : public Test {
 protected:
  NiceMock<MockInventoryProvider> m_inventory;
  NiceMock<MockHost>              m_host;
  NiceMock<MockConsole>           m_console;
  NiceMock<MockRuleSetProvider>   m_rules;
  UninstallTracker                m_tracker { m_host, m_console, TrackerOptions { .settleDelay = 0ms, .pollInterval = 1ms } };
  CleanupOrchestrator             m_orchestrator { m_inventory, m_host, m_console, m_rules, m_tracker };

  RunState m_interactive { .dryRun = false, .interactive = true, .currentPath = {} };
  RunState m_unattended { .dryRun = false, .interactive = false, .currentPath = {} };

  fn SetUp() -> void override {
    const RuleSet deviceRules {
      DeviceRule { .friendlyName = "Huion Tablet", .manufacturerName = "^Huion$" },
    };

    ON_CALL(m_rules, resolve(Category::Device)).WillByDefault(Return(Result<RuleSet>(deviceRules)));
    ON_CALL(m_inventory, enumerateDevices())
      .WillByDefault(Return(Result<Vec<Device>>(Vec<Device> {
        MakeDevice("HID\\A", "Huion"),
        MakeDevice("HID\\B", "Microsoft"),
        MakeDevice("HID\\C", "Huion"),
      })));
  }
};

TEST_F(CleanupTest, RemovesMatchesAfterConfirmation) {
  EXPECT_CALL(m_console, confirm(HasSubstr("Huion Tablet"))).Times(2).WillRepeatedly(Return(PromptResult::Yes));
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\A"))).WillOnce(Return(Removed(false)));
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\B"))).Times(0);
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\C"))).WillOnce(Return(Removed(false)));

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_interactive);

  ASSERT_TRUE(info);
  EXPECT_EQ(info->matched, 2U);
  EXPECT_EQ(info->removed, 2U);
  EXPECT_FALSE(info->rebootRequired);
}

TEST_F(CleanupTest, RebootRequirementIsSticky) {
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\A"))).WillOnce(Return(Removed(true)));
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\C"))).WillOnce(Return(Removed(false)));

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_unattended);

  ASSERT_TRUE(info);
  EXPECT_TRUE(info->rebootRequired);
}

TEST_F(CleanupTest, DecliningSkipsTheObject) {
  EXPECT_CALL(m_console, confirm(_)).WillOnce(Return(PromptResult::No)).WillOnce(Return(PromptResult::Yes));
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\A"))).Times(0);
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\C"))).WillOnce(Return(Removed(false)));

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_interactive);

  ASSERT_TRUE(info);
  EXPECT_EQ(info->matched, 2U);
  EXPECT_EQ(info->removed, 1U);
}

TEST_F(CleanupTest, CancellingStopsTheRun) {
  EXPECT_CALL(m_console, confirm(_)).WillOnce(Return(PromptResult::Cancel));
  EXPECT_CALL(m_host, removeDevice(_)).Times(0);

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_interactive);

  ASSERT_FALSE(info);
  EXPECT_EQ(info.error().code, Cancelled);
}

TEST_F(CleanupTest, AlreadyRemovedIsSkipped) {
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\A"))).WillOnce(Return(Result<RemovalOutcome>(Err(TdcError(AlreadyRemoved, "gone")))));
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\C"))).WillOnce(Return(Removed(false)));

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_unattended);

  ASSERT_TRUE(info);
  EXPECT_EQ(info->matched, 2U);
  EXPECT_EQ(info->removed, 1U);
}

TEST_F(CleanupTest, OtherRemovalErrorsStopTheRun) {
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\A"))).WillOnce(Return(Result<RemovalOutcome>(Err(TdcError(ApiUnavailable, "setup api")))));
  EXPECT_CALL(m_host, removeDevice(DeviceInstance("HID\\C"))).Times(0);

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_unattended);

  ASSERT_FALSE(info);
  EXPECT_EQ(info.error().code, ApiUnavailable);
}

TEST_F(CleanupTest, DryRunNeitherPromptsNorRemoves) {
  EXPECT_CALL(m_console, confirm(_)).Times(0);
  EXPECT_CALL(m_host, removeDevice(_)).Times(0);

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, RunState { .dryRun = true, .interactive = true, .currentPath = {} });

  ASSERT_TRUE(info);
  EXPECT_EQ(info->matched, 2U);
  EXPECT_EQ(info->removed, 0U);
}

TEST_F(CleanupTest, UnattendedRunDoesNotPrompt) {
  EXPECT_CALL(m_console, confirm(_)).Times(0);
  EXPECT_CALL(m_host, removeDevice(_)).Times(2).WillRepeatedly(Return(Removed(false)));

  EXPECT_TRUE(m_orchestrator.run(Category::Device, m_unattended));
}

TEST_F(CleanupTest, RuleResolutionFailureIsFatal) {
  EXPECT_CALL(m_rules, resolve(Category::Device)).WillOnce(Return(Result<RuleSet>(Err(TdcError(ConfigurationError, "no rules")))));
  EXPECT_CALL(m_inventory, enumerateDevices()).Times(0);

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_unattended);

  ASSERT_FALSE(info);
  EXPECT_EQ(info.error().code, ConfigurationError);
}

TEST_F(CleanupTest, DriversAreRemovedFromTheDriverStore) {
  const RuleSet driverRules { DriverRule { .friendlyName = "XP-Pen Driver", .providerName = "XP-?Pen" } };

  EXPECT_CALL(m_rules, resolve(Category::Driver)).WillOnce(Return(Result<RuleSet>(driverRules)));
  EXPECT_CALL(m_inventory, enumerateDrivers())
    .WillOnce(Return(Result<Vec<Driver>>(Vec<Driver> {
      Driver { .infName = "oem7.inf", .infOriginalName = "xppen.inf", .provider = "XP-Pen", .classGuid = "{745a17a0-74d3-11d0-b6fe-00a0c90f57da}" },
    })));
  EXPECT_CALL(m_host, removeDriver(Field(&Driver::infName, "oem7.inf"))).WillOnce(Return(Removed(true)));

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Driver, m_unattended);

  ASSERT_TRUE(info);
  EXPECT_EQ(info->removed, 1U);
  EXPECT_TRUE(info->rebootRequired);
}

TEST_F(CleanupTest, DriverPackagesUseTheRuleUninstallMethod) {
  const RuleSet packageRules {
    DriverPackageRule { .friendlyName = "Stale Wacom entry", .displayName = "^Wacom Tablet$", .uninstallMethod = UninstallMethod::RegistryOnly },
  };

  DriverPackage package;
  package.keyName         = R"(SOFTWARE\Microsoft\Windows\CurrentVersion\Uninstall\Wacom Tablet Driver)";
  package.displayName     = "Wacom Tablet";
  package.uninstallString = R"(C:\Program Files\Tablet\Wacom\Remove.exe /u)";

  EXPECT_CALL(m_rules, resolve(Category::DriverPackage)).WillOnce(Return(Result<RuleSet>(packageRules)));
  EXPECT_CALL(m_inventory, enumerateDriverPackages()).WillOnce(Return(Result<Vec<DriverPackage>>(Vec<DriverPackage> { package })));
  EXPECT_CALL(m_console, confirm(HasSubstr("Stale Wacom entry"))).WillOnce(Return(PromptResult::Yes));
  EXPECT_CALL(m_host, deleteUninstallEntry(Field(&DriverPackage::keyName, package.keyName))).WillOnce(Return(Result<> {}));
  EXPECT_CALL(m_host, launchProcess(_, _)).Times(0);

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::DriverPackage, m_interactive);

  ASSERT_TRUE(info);
  EXPECT_EQ(info->removed, 1U);
  EXPECT_FALSE(info->rebootRequired);
}

TEST_F(CleanupTest, InventoryErrorsAreFatal) {
  EXPECT_CALL(m_inventory, enumerateDevices()).WillOnce(Return(Result<Vec<Device>>(Err(TdcError(PermissionDenied, "denied")))));

  Result<ModuleRunInfo> info = m_orchestrator.run(Category::Device, m_unattended);

  ASSERT_FALSE(info);
  EXPECT_EQ(info.error().code, PermissionDenied);
}

class CleanupDumpTest : public CleanupTest {
 protected:
  fs::path m_dir;

  fn SetUp() -> void override {
    CleanupTest::SetUp();

    m_dir = fs::temp_directory_path() / std::format("tdc_{}", UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(m_dir);
  }

  fn TearDown() -> void override {
    std::error_code errc;
    fs::remove_all(m_dir, errc);
  }

  [[nodiscard]] fn readDump(const Category category) const -> String {
    std::ifstream ifs(m_dir / "dumps" / GetModuleInfo(category).dumpFile, std::ios::binary);
    return { std::istreambuf_iterator<char>(ifs), {} };
  }
};

TEST_F(CleanupDumpTest, WritesObjectsOfInterest) {
  Result<usize> written = m_orchestrator.dump(Category::Device, RunState { .dryRun = false, .interactive = false, .currentPath = m_dir });

  ASSERT_TRUE(written);
  EXPECT_EQ(*written, 2U);

  const String contents = readDump(Category::Device);

  EXPECT_THAT(contents, HasSubstr(R"("instanceId": "HID\\A")"));
  EXPECT_THAT(contents, HasSubstr(R"("instanceId": "HID\\C")"));
  EXPECT_THAT(contents, Not(HasSubstr("Microsoft")));
}

TEST_F(CleanupDumpTest, EmptyDumpStillTruncatesTheFile) {
  EXPECT_CALL(m_inventory, enumerateDrivers()).WillOnce(Return(Result<Vec<Driver>>(Vec<Driver> {})));

  Result<usize> written = m_orchestrator.dump(Category::Driver, RunState { .dryRun = false, .interactive = false, .currentPath = m_dir });

  ASSERT_TRUE(written);
  EXPECT_EQ(*written, 0U);
  EXPECT_TRUE(fs::exists(m_dir / "dumps" / "drivers.json"));
  EXPECT_TRUE(readDump(Category::Driver).empty());
}
