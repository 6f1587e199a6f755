/**
 * @file Host.hpp
 * @brief Operating system operations used to remove inventory objects and supervise uninstallers.
 */

#pragma once

#include <stop_token> // std::stop_token

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Inventory.hpp"

namespace tdc::core::host {
  namespace {
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u32;
    using utils::types::Vec;
  } // namespace

  using ProcessId = u32;

  /**
   * @struct ProcessEntry
   * @brief One row of a system process snapshot.
   */
  struct ProcessEntry {
    ProcessId      pid       = 0;
    ProcessId      parentPid = 0;
    Option<String> commandLine; ///< Absent when the process could not be queried.
  };

  /**
   * @struct RemovalOutcome
   * @brief Result of a successful device or driver removal.
   */
  struct RemovalOutcome {
    bool rebootRequired = false;
  };

  /**
   * @class IHost
   * @brief The side-effecting host operations the cleanup engine depends on.
   *
   * Implementations report a missing removal target as AlreadyRemoved, and a
   * missing executable in launchProcess as NotFound.
   */
  class IHost {
   public:
    IHost(const IHost&) = delete;
    IHost(IHost&&)      = delete;

    fn operator=(const IHost&)->IHost& = delete;
    fn operator=(IHost&&)->IHost&      = delete;

    virtual ~IHost() = default;

    /**
     * @brief Uninstalls a device node.
     * @param device The device to remove.
     * @return Whether a reboot is needed to finish the removal.
     */
    [[nodiscard]] virtual fn removeDevice(const inventory::Device& device) -> Result<RemovalOutcome> = 0;

    /**
     * @brief Removes a driver from the driver store.
     * @param driver The driver to remove.
     * @return Whether a reboot is needed to finish the removal.
     */
    [[nodiscard]] virtual fn removeDriver(const inventory::Driver& driver) -> Result<RemovalOutcome> = 0;

    /**
     * @brief Deletes the installed-programs entry of a package.
     *
     * The entry is looked up in the 32-bit or 64-bit registry view depending on DriverPackage::x86.
     */
    [[nodiscard]] virtual fn deleteUninstallEntry(const inventory::DriverPackage& package) -> Result<> = 0;

    /**
     * @brief Starts a process.
     * @param executable Path of the executable, without surrounding quotes.
     * @param arguments Argument string passed verbatim.
     * @return The new process ID, NotFound if the executable does not exist.
     */
    [[nodiscard]] virtual fn launchProcess(const String& executable, const Option<String>& arguments) -> Result<ProcessId> = 0;

    /**
     * @brief Returns the direct children of @p pid.
     */
    [[nodiscard]] virtual fn childProcesses(ProcessId pid) -> Result<Vec<ProcessId>> = 0;

    /**
     * @brief Returns a snapshot of every running process.
     */
    [[nodiscard]] virtual fn processList() -> Result<Vec<ProcessEntry>> = 0;

    /**
     * @brief Blocks until @p pid exits or a stop is requested.
     * @return Cancelled when a stop was requested first.
     *
     * A process that does not exist (anymore) counts as exited.
     */
    [[nodiscard]] virtual fn waitForExit(ProcessId pid, std::stop_token stopToken) -> Result<> = 0;

    [[nodiscard]] virtual fn currentProcessId() const -> ProcessId = 0;

    /**
     * @brief Whether the process runs with administrative rights.
     */
    [[nodiscard]] virtual fn isElevated() const -> Result<bool> = 0;

    /**
     * @brief Requests an immediate system restart.
     */
    [[nodiscard]] virtual fn reboot() -> Result<> = 0;

   protected:
    IHost() = default;
  };

  /**
   * @brief Creates the host implementation for the current platform.
   */
  fn CreateHost() -> utils::types::UniquePointer<IHost>;
} // namespace tdc::core::host
