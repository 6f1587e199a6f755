#ifdef _WIN32
  #include <windows.h> // GetModuleFileNameW
#endif

#include <cstdlib>    // EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem> // std::filesystem::{path, read_symlink, absolute}
#include <format>     // std::format
#include <stop_token> // std::stop_token

#include <TDC/Core/Cleanup.hpp>
#include <TDC/Core/Console.hpp>
#include <TDC/Core/Host.hpp>
#include <TDC/Core/Inventory.hpp>
#include <TDC/Services/Configuration.hpp>
#include <TDC/Services/Uninstaller.hpp>

#include <TDC/Utils/ArgumentParser.hpp>
#include <TDC/Utils/Error.hpp>
#include <TDC/Utils/Logging.hpp>
#include <TDC/Utils/Types.hpp>

#include "Config/Config.hpp"

using namespace tdc::utils::types;
using namespace tdc::utils::logging;
using tdc::config::Config;

namespace fs = std::filesystem;

namespace {
  using tdc::core::cleanup::CleanupOrchestrator;
  using tdc::core::cleanup::ModuleInfo;
  using tdc::core::cleanup::MODULES;
  using tdc::core::cleanup::ModuleRunInfo;
  using tdc::core::cleanup::RunState;
  using enum tdc::utils::error::TdcErrorCode;

  /**
   * @brief Settings of this run after merging config.toml and the command line.
   */
  struct Options {
    bool             dryRun       = false;
    bool             dump         = false;
    bool             interactive  = true;
    bool             useCache     = true;
    bool             allowUpdates = true;
    Vec<ModuleInfo>  modules;
  };

  fn GetExecutableDirectory(const char* argv0) -> fs::path {
    std::error_code errc;

#ifdef _WIN32
    Array<wchar_t, MAX_PATH> buffer {};

    if (const DWORD length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size())); length > 0 && length < buffer.size())
      return fs::path(buffer.data()).parent_path();
#else
    if (const fs::path self = fs::read_symlink("/proc/self/exe", errc); !errc)
      return self.parent_path();
#endif

    if (const fs::path absolute = fs::absolute(argv0, errc); !errc)
      return absolute.parent_path();

    return fs::current_path();
  }

  fn WaitForKey(tdc::core::console::IConsole& console) -> Option<char> {
    return console.waitForKey(std::stop_token {});
  }

  fn RunDump(CleanupOrchestrator& orchestrator, const Options& options, const RunState& state) -> i32 {
    for (const ModuleInfo& module : options.modules)
      if (Result<usize> dumped = orchestrator.dump(module.category, state); !dumped) {
        error_at(dumped.error());
        Println("Errors were encountered while dumping '{}'. Aborting!", module.name);
        return EXIT_FAILURE;
      }

    return EXIT_SUCCESS;
  }

  fn RunCleanup(CleanupOrchestrator& orchestrator, tdc::core::host::IHost& host, tdc::core::console::IConsole& console, const Options& options, const RunState& state) -> i32 {
    bool rebootRequired = false;

    for (const ModuleInfo& module : options.modules) {
      Println("Running '{}'...", module.name);

      Result<ModuleRunInfo> info = orchestrator.run(module.category, state);

      if (!info) {
        if (info.error().code == Cancelled) {
          debug_at(info.error());
          return EXIT_SUCCESS;
        }

        error_at(info.error());
        Println("Errors were encountered while running '{}'. Aborting!", module.name);

        if (options.interactive)
          WaitForKey(console);

        return EXIT_FAILURE;
      }

      debug_log("'{}' matched {} and removed {}", module.name, info->matched, info->removed);

      rebootRequired = rebootRequired || info->rebootRequired;

      Println();
    }

    if (rebootRequired) {
      Println("Reboot is required to complete the cleanup.");

      if (!options.interactive)
        return EXIT_SUCCESS;

      Print("Press any key to reboot now, or press 'q' to cancel reboot...");
      Flush();

      const Option<char> key = WaitForKey(console);

      Println();

      if (key && *key != 'q' && *key != 'Q') {
        if (Result<> rebooted = host.reboot(); !rebooted) {
          error_at(rebooted.error());
          return EXIT_FAILURE;
        }
      }

      return EXIT_SUCCESS;
    }

    if (options.interactive) {
      Print("Cleanup complete. Press any key to exit...");
      Flush();
      WaitForKey(console);
      Println();
    }

    return EXIT_SUCCESS;
  }
} // namespace

fn main(const i32 argc, char* argv[]) -> i32 try {
  using tdc::utils::argparse::ArgumentParser;
  using tdc::utils::argparse::ParseAction;

  Println("TabletDriverCleanup v{}", TDC_VERSION);

  ArgumentParser parser("TabletDriverCleanup", TDC_VERSION);

  parser
    .addArguments("-d", "--dry-run")
    .help("Do not uninstall anything, only show what would be uninstalled.")
    .flag();

  parser
    .addArguments("-D", "--dump")
    .help("Dump the devices, drivers and driver packages of interest into the 'dumps' directory.")
    .flag();

  parser
    .addArguments("-s", "--no-prompt")
    .help("Do not ask before uninstalling and do not wait for a key at the end.")
    .flag();

  parser
    .addArguments("-c", "--no-cache")
    .help("Do not use or update the rule files cached next to the executable.")
    .flag();

  parser
    .addArguments("-u", "--no-update")
    .help("Do not download the latest rule files.")
    .flag();

  for (const ModuleInfo& module : MODULES)
    parser
      .addArguments(std::format("--no-{}", module.cliName))
      .help(String(module.disablementDescription))
      .flag();

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .defaultEnum(LogLevel::Info);

  if (Result<ParseAction> action = parser.parseArgs({ argv, static_cast<usize>(argc) }); !action) {
    error_at(action.error());
    return EXIT_FAILURE;
  } else if (*action != ParseAction::Continue)
    return EXIT_SUCCESS;

  const fs::path exeDir = GetExecutableDirectory(argv[0]);
  const Config   config = Config::load(exeDir);

  if (parser.get<bool>("--verbose"))
    SetRuntimeLogLevel(LogLevel::Debug);
  else if (parser.isUsed("--log-level"))
    SetRuntimeLogLevel(parser.getEnum<LogLevel>("--log-level").value_or(LogLevel::Info));
  else
    SetRuntimeLogLevel(config.general.logLevel.value_or(LogLevel::Info));

  Options options {
    .dryRun       = parser.get<bool>("--dry-run") || config.cleanup.dryRun,
    .dump         = parser.get<bool>("--dump"),
    .interactive  = !parser.get<bool>("--no-prompt") && config.cleanup.prompt,
    .useCache     = !parser.get<bool>("--no-cache") && config.cleanup.useCache,
    .allowUpdates = !parser.get<bool>("--no-update") && config.cleanup.checkUpdates,
    .modules      = {},
  };

  for (const ModuleInfo& module : MODULES) {
    if (parser.get<bool>(std::format("--no-{}", module.cliName)) || config.cleanup.isDisabled(module.cliName)) {
      debug_log("'{}' is disabled", module.name);
      continue;
    }

    options.modules.push_back(module);
  }

  const UniquePointer<tdc::core::inventory::IInventoryProvider> inventory = tdc::core::inventory::CreateInventoryProvider();
  const UniquePointer<tdc::core::host::IHost>                   host      = tdc::core::host::CreateHost();
  const UniquePointer<tdc::core::console::IConsole>             console   = tdc::core::console::CreateConsole();

  const RunState state {
    .dryRun      = options.dryRun,
    .interactive = options.interactive,
    .currentPath = exeDir,
  };

  // Removal needs administrative rights; a dry run and a dump only read.
  if (!options.dryRun && !options.dump) {
    Result<bool> elevated = host->isElevated();

    if (!elevated)
      debug_at(elevated.error());

    if (!elevated || !*elevated) {
      Println("This program must be run as administrator.");
      return EXIT_FAILURE;
    }
  }

  if (options.allowUpdates)
    if (Result<> network = tdc::services::configuration::InitializeNetwork(); !network) {
      warn_at(network.error());
      options.allowUpdates = false;
    }

  tdc::services::configuration::ConfigurationResolver resolver({
    .exeDir       = exeDir,
    .useCache     = options.useCache,
    .allowUpdates = options.allowUpdates,
  });

  tdc::services::uninstaller::UninstallTracker tracker(*host, *console);

  CleanupOrchestrator orchestrator(*inventory, *host, *console, resolver, tracker);

  const i32 exitCode = options.dump ? RunDump(orchestrator, options, state) : RunCleanup(orchestrator, *host, *console, options, state);

  if (options.allowUpdates)
    tdc::services::configuration::ShutdownNetwork();

  return exitCode;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
