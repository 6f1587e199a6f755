/**
 * @file Uninstaller.hpp
 * @brief Runs third-party uninstallers and tracks them until they are really done.
 *
 * Vendor uninstallers are frequently thin proxies: they unpack the real
 * uninstaller somewhere, start it and either block on it (Normal) or exit
 * right away (Deferred). The tracker follows both shapes, and lets an
 * interactive user end the wait early.
 */

#pragma once

#include <chrono>     // std::chrono::milliseconds
#include <stop_token> // std::stop_token

#include "../Core/Console.hpp"
#include "../Core/Host.hpp"
#include "../Core/Inventory.hpp"
#include "../Core/Rules.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace tdc::services::uninstaller {
  namespace {
    using utils::types::Fn;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  /**
   * @struct Invocation
   * @brief An uninstall command line split into program and arguments.
   */
  struct Invocation {
    String         executable; ///< Program path, still quoted if it was quoted.
    Option<String> arguments;  ///< Trimmed argument string, absent if there was none.
  };

  /**
   * @brief Splits a command line into program and arguments.
   *
   * A leading quote starts a quoted program path that runs until the matching
   * unescaped quote followed by a space. A backslash escapes the next character.
   * Unquoted command lines are split at the first space.
   *
   * @return ParseError for an empty string or an unterminated quote.
   */
  fn ParseInvocation(StringView commandLine) -> Result<Invocation>;

  /**
   * @brief Splits a command line at the first ".exe " boundary.
   *
   * Handles uninstall strings whose program path lost its closing quote. When
   * there is no such boundary the whole string is the program.
   */
  fn ParseInvocationFallback(StringView commandLine) -> Invocation;

  /**
   * @brief Removes a surrounding pair of quotes, or a lone leading quote.
   */
  fn StripQuotes(StringView path) -> String;

  /**
   * @brief Returns the directory part of an unquoted program path, or "" if it has none.
   */
  fn ContainingDirectory(StringView path) -> String;

  struct TrackerOptions {
    std::chrono::milliseconds settleDelay  { 500 }; ///< Pause between a Deferred proxy exiting and the process scan.
    std::chrono::milliseconds pollInterval { 20 };  ///< How often the interactive race checks its two tasks.
  };

  /**
   * @class UninstallTracker
   * @brief Removes driver packages with one of the UninstallMethod strategies.
   */
  class UninstallTracker {
   public:
    UninstallTracker(core::host::IHost& host, core::console::IConsole& console, TrackerOptions options = {});

    /**
     * @brief Removes @p package.
     * @param package The package to remove.
     * @param method The strategy named by the matching rule.
     * @param interactive Whether the user may end the wait with a keypress.
     * @return AlreadyRemoved when the uninstaller no longer exists. Any other error is fatal.
     *
     * When interactive, the strategy races a keypress. A keypress counts as a
     * successful removal and cancels the strategy; a strategy error is returned as is.
     */
    fn uninstall(const core::inventory::DriverPackage& package, core::rules::UninstallMethod method, bool interactive) -> Result<>;

    /**
     * @brief Launches the uninstaller and waits for it and all its descendants, depth first.
     */
    fn runNormal(const core::inventory::DriverPackage& package, std::stop_token stopToken) -> Result<>;

    /**
     * @brief Launches the uninstaller, waits for it, then waits for the process it handed off to.
     *
     * After a settle delay every process whose command line mentions the
     * directory of the uninstaller is a candidate, and the first one is awaited.
     * With no candidate the removal is complete.
     */
    fn runDeferred(const core::inventory::DriverPackage& package, std::stop_token stopToken) -> Result<>;

    /**
     * @brief Only deletes the installed-programs entry.
     */
    fn runRegistryOnly(const core::inventory::DriverPackage& package) -> Result<>;

    /**
     * @brief Runs @p strategy against a keypress; the first to finish wins.
     */
    fn race(const Fn<Result<>(std::stop_token)>& strategy) -> Result<>;

   private:
    core::host::IHost&       m_host;
    core::console::IConsole& m_console;
    TrackerOptions           m_options;

    fn launch(StringView uninstallString) -> Result<core::host::ProcessId>;
    fn waitForDescendants(core::host::ProcessId pid, std::stop_token stopToken) -> Result<>;
    fn findDelegate(StringView targetDir) -> Result<Option<core::host::ProcessId>>;
    fn settle(std::stop_token stopToken) const -> Result<>;
  };
} // namespace tdc::services::uninstaller
