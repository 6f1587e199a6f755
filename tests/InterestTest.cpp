#include <TDC/Core/Inventory.hpp>
#include <TDC/Services/Interest.hpp>

#include <TDC/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace tdc::utils::types;
using tdc::core::inventory::Device;
using tdc::core::inventory::Driver;
using tdc::core::inventory::DriverPackage;
using tdc::core::inventory::InventoryObject;
using tdc::services::interest::InterestScreen;

class InterestTest : public testing::Test {
 protected:
  InterestScreen m_screen;

  fn interesting(const Option<StringView> text) -> bool {
    Result<bool> result = m_screen.isOfInterest(text);
    return result && *result;
  }

  fn interesting(const InventoryObject& object) -> bool {
    Result<bool> result = m_screen.isOfInterest(object);
    return result && *result;
  }
};

TEST_F(InterestTest, VendorNamesAreOfInterest) {
  EXPECT_TRUE(interesting("Huion Tablet"));
  EXPECT_TRUE(interesting("WACOM"));
  EXPECT_TRUE(interesting("XP-PEN"));
  EXPECT_TRUE(interesting("xppen"));
  EXPECT_TRUE(interesting("UC Logic"));
  EXPECT_TRUE(interesting("vmultihid"));
}

TEST_F(InterestTest, UnrelatedTextIsNotOfInterest) {
  EXPECT_FALSE(interesting("Realtek High Definition Audio"));
  EXPECT_FALSE(interesting(""));
  EXPECT_FALSE(interesting(None));
}

TEST_F(InterestTest, CounterPatternsReject) {
  EXPECT_FALSE(interesting("Android Tablet"));
  EXPECT_FALSE(interesting("Logitech USB Digitizer"));
}

TEST_F(InterestTest, CandidateListMatchesWhenAnyEntryMatches) {
  const Array<Option<StringView>, 3> candidates = { None, "Generic", "Gaomon" };
  const Array<Option<StringView>, 2> nothing    = { None, "Generic" };

  Result<bool> first  = m_screen.isCandidate(candidates);
  Result<bool> second = m_screen.isCandidate(nothing);

  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_TRUE(*first);
  EXPECT_FALSE(*second);
}

TEST_F(InterestTest, DeviceHardwareIdsAreCandidates) {
  Device device;
  device.instanceId  = R"(USB\VID_056A&PID_0374\1)";
  device.hardwareIds = { R"(USB\VID_056A&PID_0374)", R"(HID\Wacom_Intuos)" };

  EXPECT_TRUE(interesting(InventoryObject(device)));

  device.hardwareIds = { R"(USB\VID_046D&PID_C52B)" };

  EXPECT_FALSE(interesting(InventoryObject(device)));
}

TEST_F(InterestTest, DriverProviderIsACandidate) {
  Driver driver;
  driver.infName  = "oem3.inf";
  driver.provider = "Veikk";

  EXPECT_TRUE(interesting(InventoryObject(driver)));
}

TEST_F(InterestTest, PackageNeedsNameAndUninstallString) {
  DriverPackage package;
  package.keyName     = "SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\Huion";
  package.displayName = "HuionTablet";

  EXPECT_FALSE(interesting(InventoryObject(package)));

  package.uninstallString = R"("C:\Program Files\HuionTablet\uninstall.exe")";

  EXPECT_TRUE(interesting(InventoryObject(package)));

  package.displayName.reset();

  EXPECT_FALSE(interesting(InventoryObject(package)));
}
