/**
 * @file Cleanup.hpp
 * @brief Per-category cleanup workflow and dump output.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Services/Interest.hpp"
#include "../Services/Uninstaller.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/RuleCache.hpp"
#include "../Utils/Types.hpp"
#include "Console.hpp"
#include "Host.hpp"
#include "Inventory.hpp"
#include "Rules.hpp"

namespace tdc::core::cleanup {
  namespace {
    using utils::types::Array;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct ModuleInfo
   * @brief Static description of one cleanup module.
   */
  struct ModuleInfo {
    rules::Category category;
    StringView      name;                   ///< Display name, e.g. "Device Cleanup".
    StringView      cliName;                ///< Used for `--no-<cliName>` and config.toml.
    StringView      disablementDescription; ///< Help text of the `--no-<cliName>` flag.
    StringView      noun;                   ///< Plural noun used in console messages.
    StringView      dumpFile;               ///< File name under `dumps/`.
  };

  /**
   * @brief Every module, in the order they run.
   */
  // clang-format off
  inline constexpr Array<ModuleInfo, 3> MODULES = {{
    { rules::Category::DriverPackage, "Driver Package Cleanup", "driver-package-cleanup", "do not remove driver packages from the system", "driver packages", "driver_packages.json" },
    { rules::Category::Device,        "Device Cleanup",         "device-cleanup",         "do not remove devices from the system",         "devices",         "devices.json"         },
    { rules::Category::Driver,        "Driver Cleanup",         "driver-cleanup",         "do not remove drivers from the system",         "drivers",         "drivers.json"         },
  }};
  // clang-format on

  fn GetModuleInfo(rules::Category category) -> const ModuleInfo&;

  /**
   * @struct RunState
   * @brief Settings fixed for the whole run.
   */
  struct RunState {
    bool                  dryRun      = false; ///< Report what would be removed without removing it.
    bool                  interactive = true;  ///< Ask before each removal and allow ending uninstaller waits early.
    std::filesystem::path currentPath;         ///< Directory holding the executable.
  };

  /**
   * @struct ModuleRunInfo
   * @brief What a module run reports back to the caller.
   */
  struct ModuleRunInfo {
    bool  rebootRequired = false; ///< Set once any removal needs a reboot; never cleared.
    usize matched        = 0;
    usize removed        = 0;
  };

  /**
   * @class CleanupOrchestrator
   * @brief Matches inventory objects against rules and removes the matches one at a time.
   */
  class CleanupOrchestrator {
   public:
    CleanupOrchestrator(
      inventory::IInventoryProvider&        inventory,
      host::IHost&                          host,
      console::IConsole&                    console,
      rules::IRuleSetProvider&              rules,
      services::uninstaller::UninstallTracker& tracker
    );

    /**
     * @brief Runs one module.
     *
     * Objects are processed in enumeration order. Declining a prompt skips the
     * object; cancelling returns a Cancelled error at once. An AlreadyRemoved
     * removal is reported and skipped. Any other error stops the run.
     *
     * @param category The module to run.
     * @param state Run settings.
     * @return Whether any removal asked for a reboot.
     */
    fn run(rules::Category category, const RunState& state) -> Result<ModuleRunInfo>;

    /**
     * @brief Writes the objects of interest of one category to `<currentPath>/dumps/<dumpFile>`.
     * @return The number of objects written.
     */
    fn dump(rules::Category category, const RunState& state) -> Result<usize>;

   private:
    inventory::IInventoryProvider&           m_inventory;
    host::IHost&                             m_host;
    console::IConsole&                       m_console;
    rules::IRuleSetProvider&                 m_rules;
    services::uninstaller::UninstallTracker& m_tracker;
    utils::cache::RuleCache                  m_cache;
    services::interest::InterestScreen       m_interest;

    fn collect(rules::Category category) -> Result<Vec<inventory::InventoryObject>>;
    fn remove(const inventory::InventoryObject& object, const rules::UninstallRule& rule, bool interactive) -> Result<host::RemovalOutcome>;
  };
} // namespace tdc::core::cleanup
