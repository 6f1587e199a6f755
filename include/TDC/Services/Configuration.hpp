/**
 * @file Configuration.hpp
 * @brief Locates the rule file of a category.
 *
 * Sources are tried in a fixed order and the first one that yields the file wins:
 *   1. `<exeDir>/config/<file>` (skipped when caching is disabled)
 *   2. the version-pinned remote copy, downloaded into `<exeDir>/config`
 *      or a throwaway temporary directory (skipped when updates are disabled)
 *   3. the copy embedded into the program at build time
 *
 * A failing source is logged and skipped. Running out of sources is a
 * ConfigurationError, and so is a file that does not parse.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Core/Rules.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace tdc::services::configuration {
  namespace {
    using utils::types::Fn;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  inline constexpr StringView REMOTE_BASE_URL    = "https://raw.githubusercontent.com/X9VoiD/TabletDriverCleanup";
  inline constexpr StringView REMOTE_VERSION_REF = "v3.x";
  inline constexpr StringView PROGRAM_NAME       = "TabletDriverCleanup";

  /**
   * @brief Fetches a URL and returns the response body.
   */
  using Downloader = Fn<Result<String>(const String& url)>;

  /**
   * @brief Looks up an embedded resource by name.
   */
  using EmbeddedLookup = Fn<Option<StringView>(StringView resourceName)>;

  struct ResolverOptions {
    std::filesystem::path exeDir;              ///< Directory holding the executable.
    bool                  useCache     = true; ///< Read and write `<exeDir>/config`.
    bool                  allowUpdates = true; ///< Download rule files from the remote source.
  };

  /**
   * @brief Returns `<base>/<ref>/config/<fileName>`.
   */
  fn GetRemoteUrl(StringView fileName) -> String;

  /**
   * @brief Returns the embedded resource name of a rule file, e.g. "TabletDriverCleanup.device_identifiers.json".
   */
  fn GetResourceName(StringView fileName) -> String;

  /**
   * @brief Looks a rule file up in the table generated from the `config` directory at build time.
   */
  fn FindEmbeddedRuleFile(StringView resourceName) -> Option<StringView>;

  /**
   * @brief Downloads a URL with libcurl.
   */
  fn DownloadWithCurl(const String& url) -> Result<String>;

  /**
   * @brief Sets up libcurl once per process. Call before any download.
   */
  fn InitializeNetwork() -> Result<>;

  /**
   * @brief Releases what InitializeNetwork acquired.
   */
  fn ShutdownNetwork() -> utils::types::Unit;

  class ConfigurationResolver final : public core::rules::IRuleSetProvider {
   public:
    explicit ConfigurationResolver(ResolverOptions options, Downloader downloader = DownloadWithCurl, EmbeddedLookup embedded = FindEmbeddedRuleFile);

    /**
     * @brief Resolves and parses the rule set of a category.
     */
    [[nodiscard]] fn resolve(core::rules::Category category) -> Result<core::rules::RuleSet> override;

    /**
     * @brief Returns the raw text of a rule file from the first source that has it.
     */
    [[nodiscard]] fn resolveText(StringView fileName) -> Result<String>;

   private:
    ResolverOptions m_options;
    Downloader      m_downloader;
    EmbeddedLookup  m_embedded;

    Option<std::filesystem::path> m_downloadDir;

    [[nodiscard]] fn readLocal(StringView fileName) const -> Result<String>;
    [[nodiscard]] fn fetchRemote(StringView fileName) -> Result<String>;
    [[nodiscard]] fn readEmbedded(StringView fileName) const -> Result<String>;
    [[nodiscard]] fn downloadDirectory() -> Result<std::filesystem::path>;
  };
} // namespace tdc::services::configuration
