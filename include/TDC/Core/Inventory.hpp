/**
 * @file Inventory.hpp
 * @brief Snapshot records of the devices, drivers and driver packages present on the host.
 *
 * Records are produced once per run by an IInventoryProvider and are treated as
 * immutable afterwards. Every optional field is absent when the OS did not report it.
 */

#pragma once

#include <glaze/glaze.hpp>
#include <variant> // std::variant

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace tdc::core::inventory {
  namespace {
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct Device
   * @brief A device node known to the Plug and Play manager.
   */
  struct Device {
    String         instanceId;          ///< Device instance ID, unique per connection.
    Vec<String>    hardwareIds;         ///< Hardware IDs, most specific first.
    Option<String> friendlyName;        ///< SPDRP_FRIENDLYNAME.
    Option<String> description;         ///< SPDRP_DEVICEDESC.
    Option<String> manufacturer;        ///< SPDRP_MFG.
    Option<String> driverName;          ///< SPDRP_DRIVER (driver key name).
    Option<String> className;           ///< SPDRP_CLASS.
    String         classGuid;           ///< Setup class GUID in registry form, e.g. "{745a17a0-...}".
    Option<String> infName;             ///< Published INF name (oemN.inf).
    Option<String> infOriginalName;     ///< INF file name inside the driver store.
    Option<String> infSection;          ///< Install section used from the INF.
    Option<String> infProvider;         ///< Provider named by the INF.
    Option<String> driverStoreLocation; ///< Driver store directory holding the INF.
    bool           generic = false;     ///< Whether a generic (inbox) driver is installed.
  };

  /**
   * @struct Driver
   * @brief A third-party driver package published to the driver store.
   */
  struct Driver {
    String         infName;             ///< Published INF name (oemN.inf).
    Option<String> infOriginalName;     ///< Original INF file name.
    Option<String> driverStoreLocation; ///< Driver store directory holding the original INF.
    Option<String> provider;            ///< [Version] Provider.
    Option<String> className;           ///< [Version] Class.
    String         classGuid;           ///< [Version] ClassGUID in registry form.
  };

  /**
   * @struct DriverPackage
   * @brief An entry of the installed-programs list (the registry Uninstall key).
   */
  struct DriverPackage {
    bool           x86 = false;     ///< Whether the entry lives in the 32-bit (WOW6432Node) registry view.
    String         keyName;         ///< Sub-path of the entry below HKLM, e.g. "SOFTWARE\...\Uninstall\{GUID}".
    Option<String> displayName;     ///< DisplayName value.
    Option<String> displayVersion;  ///< DisplayVersion value.
    Option<String> publisher;       ///< Publisher value.
    Option<String> installLocation; ///< InstallLocation value.
    Option<String> uninstallString; ///< UninstallString value, an opaque command line.
  };

  /**
   * @brief Any inventory record. The set of kinds is closed.
   */
  using InventoryObject = std::variant<Device, Driver, DriverPackage>;

  /**
   * @class IInventoryProvider
   * @brief Reads the current device, driver and driver package inventory from the host.
   */
  class IInventoryProvider {
   public:
    IInventoryProvider(const IInventoryProvider&) = delete;
    IInventoryProvider(IInventoryProvider&&)      = delete;

    fn operator=(const IInventoryProvider&)->IInventoryProvider& = delete;
    fn operator=(IInventoryProvider&&)->IInventoryProvider&      = delete;

    virtual ~IInventoryProvider() = default;

    /**
     * @brief Enumerates every present device of every setup class.
     * @return The devices in enumeration order.
     */
    [[nodiscard]] virtual fn enumerateDevices() const -> Result<Vec<Device>> = 0;

    /**
     * @brief Enumerates third-party drivers published as oemN.inf.
     * @return The drivers in enumeration order.
     */
    [[nodiscard]] virtual fn enumerateDrivers() const -> Result<Vec<Driver>> = 0;

    /**
     * @brief Enumerates installed-program entries from both registry views (64-bit first).
     * @return The packages in enumeration order.
     */
    [[nodiscard]] virtual fn enumerateDriverPackages() const -> Result<Vec<DriverPackage>> = 0;

   protected:
    IInventoryProvider() = default;
  };

  /**
   * @brief Creates the inventory provider for the current platform.
   */
  fn CreateInventoryProvider() -> utils::types::UniquePointer<IInventoryProvider>;
} // namespace tdc::core::inventory

namespace glz {
  template <>
  struct meta<tdc::core::inventory::Device> {
    using T = tdc::core::inventory::Device;

    // clang-format off
    static constexpr detail::Object value = object(
      "instanceId",          &T::instanceId,
      "hardwareIds",         &T::hardwareIds,
      "friendlyName",        &T::friendlyName,
      "description",         &T::description,
      "manufacturer",        &T::manufacturer,
      "driverName",          &T::driverName,
      "className",           &T::className,
      "classGuid",           &T::classGuid,
      "infName",             &T::infName,
      "infOriginalName",     &T::infOriginalName,
      "infSection",          &T::infSection,
      "infProvider",         &T::infProvider,
      "driverStoreLocation", &T::driverStoreLocation,
      "generic",             &T::generic
    );
    // clang-format on
  };

  template <>
  struct meta<tdc::core::inventory::Driver> {
    using T = tdc::core::inventory::Driver;

    // clang-format off
    static constexpr detail::Object value = object(
      "infName",             &T::infName,
      "infOriginalName",     &T::infOriginalName,
      "driverStoreLocation", &T::driverStoreLocation,
      "provider",            &T::provider,
      "className",           &T::className,
      "classGuid",           &T::classGuid
    );
    // clang-format on
  };

  template <>
  struct meta<tdc::core::inventory::DriverPackage> {
    using T = tdc::core::inventory::DriverPackage;

    // clang-format off
    static constexpr detail::Object value = object(
      "x86",             &T::x86,
      "keyName",         &T::keyName,
      "displayName",     &T::displayName,
      "displayVersion",  &T::displayVersion,
      "publisher",       &T::publisher,
      "installLocation", &T::installLocation,
      "uninstallString", &T::uninstallString
    );
    // clang-format on
  };
} // namespace glz
