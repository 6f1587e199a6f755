#pragma once

#include <filesystem> // std::filesystem::path

#include <toml++/impl/table.hpp> // toml::table

#include <TDC/Utils/Definitions.hpp>
#include <TDC/Utils/Logging.hpp>
#include <TDC/Utils/Types.hpp>

namespace tdc::config {
  namespace {
    using utils::logging::LogLevel;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct General
   * @brief Holds general settings.
   */
  struct General {
    Option<LogLevel> logLevel; ///< Minimum log level; the command line takes precedence.

    /**
     * @brief Parses a TOML table to create a General instance.
     * @param tbl The TOML table to parse, containing [general].
     * @return A General instance with the parsed values, or defaults otherwise.
     */
    static fn fromToml(const toml::table& tbl) -> General;
  };

  /**
   * @struct Cleanup
   * @brief Holds the defaults of the cleanup run.
   *
   * Command-line flags can only move these in the direction they name, e.g.
   * `--no-prompt` turns prompting off but nothing turns it back on.
   */
  struct Cleanup {
    bool        dryRun       = false; ///< Report matches without removing anything.
    bool        prompt       = true;  ///< Ask before every removal.
    bool        useCache     = true;  ///< Use rule files cached next to the executable.
    bool        checkUpdates = true;  ///< Try to download the latest rule files.
    Vec<String> disabledModules;      ///< CLI names of modules that should not run.

    static fn fromToml(const toml::table& tbl) -> Cleanup;

    /**
     * @brief Whether the module with the given CLI name was disabled in the file.
     */
    [[nodiscard]] fn isDisabled(utils::types::StringView cliName) const -> bool;
  };

  /**
   * @struct Config
   * @brief Holds the settings read from config.toml.
   */
  struct Config {
    General general; ///< [general]
    Cleanup cleanup; ///< [cleanup]

    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The TOML table to parse, containing [general] and [cleanup].
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Loads config.toml from the first location that has one.
     * @param exeDir Directory of the executable, searched last.
     * @return The parsed settings, or defaults when no file exists or it is malformed.
     *
     * Looks in `%LOCALAPPDATA%\TabletDriverCleanup` on Windows or
     * `$XDG_CONFIG_HOME/TabletDriverCleanup` and `~/.config/TabletDriverCleanup`
     * elsewhere, then in @p exeDir.
     */
    static fn load(const std::filesystem::path& exeDir) -> Config;
  };
} // namespace tdc::config
