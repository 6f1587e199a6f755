#include "Config.hpp"

#include <algorithm>                 // std::ranges::find
#include <system_error>              // std::error_code
#include <toml++/impl/array.hpp>     // toml::array
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/parser.hpp>    // toml::{parse_file, parse_error}

#include <TDC/Utils/Env.hpp>
#include <TDC/Utils/Error.hpp>

namespace fs = std::filesystem;

namespace tdc::config {
  namespace {
    using utils::types::Result;
    using utils::types::StringView;

    constexpr StringView CONFIG_DIRECTORY = "TabletDriverCleanup";
    constexpr StringView CONFIG_FILE      = "config.toml";

    fn GetConfigPath(const fs::path& exeDir) -> Option<fs::path> {
      using utils::env::GetEnv;

      Vec<fs::path> possiblePaths;

#ifdef _WIN32
      if (Result<String> result = GetEnv("LOCALAPPDATA"))
        possiblePaths.emplace_back(fs::path(*result) / CONFIG_DIRECTORY / CONFIG_FILE);
#else
      if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
        possiblePaths.emplace_back(fs::path(*result) / CONFIG_DIRECTORY / CONFIG_FILE);

      if (Result<String> result = GetEnv("HOME"))
        possiblePaths.emplace_back(fs::path(*result) / ".config" / CONFIG_DIRECTORY / CONFIG_FILE);
#endif

      possiblePaths.emplace_back(exeDir / CONFIG_FILE);

      for (const fs::path& path : possiblePaths)
        if (std::error_code errc; fs::exists(path, errc) && !errc)
          return path;

      return utils::types::None;
    }
  } // namespace

  fn General::fromToml(const toml::table& tbl) -> General {
    General gen;

    if (const Option<String> level = tbl["log_level"].value<String>()) {
      gen.logLevel = utils::logging::ParseLogLevel(*level);

      if (!gen.logLevel)
        warn_log("Invalid log_level '{}' in config. Accepted values are 'debug', 'info', 'warn' and 'error'.", *level);
    }

    return gen;
  }

  fn Cleanup::fromToml(const toml::table& tbl) -> Cleanup {
    Cleanup cleanup;

    cleanup.dryRun       = tbl["dry_run"].value_or(false);
    cleanup.prompt       = tbl["prompt"].value_or(true);
    cleanup.useCache     = tbl["use_cache"].value_or(true);
    cleanup.checkUpdates = tbl["check_updates"].value_or(true);

    if (const toml::array* modules = tbl["disabled_modules"].as_array())
      for (const toml::node& module : *modules) {
        if (const Option<String> name = module.value<String>())
          cleanup.disabledModules.push_back(*name);
        else
          warn_log("Ignoring a non-string entry in disabled_modules");
      }

    return cleanup;
  }

  fn Cleanup::isDisabled(const StringView cliName) const -> bool {
    return std::ranges::find(disabledModules, cliName) != disabledModules.end();
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view genTbl     = tbl["general"];
    const toml::node_view cleanupTbl = tbl["cleanup"];

    this->general = genTbl.is_table() ? General::fromToml(*genTbl.as_table()) : General {};
    this->cleanup = cleanupTbl.is_table() ? Cleanup::fromToml(*cleanupTbl.as_table()) : Cleanup {};
  }

  fn Config::load(const fs::path& exeDir) -> Config {
    const Option<fs::path> configPath = GetConfigPath(exeDir);

    if (!configPath) {
      debug_log("No config.toml found, using defaults");
      return {};
    }

    try {
      const toml::table parsedConfig = toml::parse_file(configPath->string());

      debug_log("Config loaded from {}", configPath->string());

      return Config(parsedConfig);
    } catch (const toml::parse_error& err) {
      warn_log("Failed to parse {}: {}. Using defaults.", configPath->string(), err.description());
      return {};
    }
  }
} // namespace tdc::config
