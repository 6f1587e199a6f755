#include "TDC/Services/Configuration.hpp"

#include <format> // std::format
#include <random> // std::{random_device, mt19937_64, uniform_int_distribution}

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Logging.hpp"
#include "TDC/Utils/Types.hpp"

#include "EmbeddedRules.hpp"
#include "Utils/Files.hpp"
#include "Wrappers/Curl.hpp"

namespace tdc::services::configuration {
  namespace {
    namespace fs = std::filesystem;

    using utils::error::TdcError;
    using enum utils::error::TdcErrorCode;

    using utils::types::Err;
    using utils::types::None;
    using utils::types::u64;

    using core::rules::Category;
    using core::rules::GetRuleFileName;
    using core::rules::ParseRuleSet;
    using core::rules::RuleSet;

    fn RandomDirectoryName() -> String {
      std::random_device                 device;
      std::mt19937_64                    engine(device());
      std::uniform_int_distribution<u64> dist;

      return std::format("{:016x}", dist(engine));
    }
  } // namespace

  fn GetRemoteUrl(const StringView fileName) -> String {
    return std::format("{}/{}/config/{}", REMOTE_BASE_URL, REMOTE_VERSION_REF, fileName);
  }

  fn GetResourceName(const StringView fileName) -> String {
    return std::format("{}.{}", PROGRAM_NAME, fileName);
  }

  fn FindEmbeddedRuleFile(const StringView resourceName) -> Option<StringView> {
    for (const auto& [name, contents] : embedded::RULE_FILES)
      if (GetResourceName(name) == resourceName)
        return contents;

    return None;
  }

  fn DownloadWithCurl(const String& url) -> Result<String> {
    return Curl::Download(url, String(PROGRAM_NAME) + "/" TDC_VERSION);
  }

  fn InitializeNetwork() -> Result<> {
    return Curl::GlobalInit();
  }

  fn ShutdownNetwork() -> utils::types::Unit {
    Curl::GlobalCleanup();
  }

  ConfigurationResolver::ConfigurationResolver(ResolverOptions options, Downloader downloader, EmbeddedLookup embedded)
    : m_options(std::move(options)), m_downloader(std::move(downloader)), m_embedded(std::move(embedded)) {}

  fn ConfigurationResolver::resolve(const Category category) -> Result<RuleSet> {
    const StringView fileName = GetRuleFileName(category);

    Result<String> text = resolveText(fileName);

    if (!text)
      return Err(text.error());

    return ParseRuleSet(category, *text);
  }

  fn ConfigurationResolver::resolveText(const StringView fileName) -> Result<String> {
    if (m_options.useCache) {
      if (Result<String> local = readLocal(fileName)) {
        debug_log("Using cached '{}'", fileName);
        return local;
      } else
        debug_at(local.error());
    }

    if (m_options.allowUpdates) {
      if (Result<String> remote = fetchRemote(fileName)) {
        debug_log("Using downloaded '{}'", fileName);
        return remote;
      } else
        warn_at(remote.error());
    }

    if (Result<String> bundled = readEmbedded(fileName)) {
      debug_log("Using embedded '{}'", fileName);
      return bundled;
    } else
      debug_at(bundled.error());

    ERR_FMT(ConfigurationError, "Configuration '{}' not found", fileName);
  }

  fn ConfigurationResolver::readLocal(const StringView fileName) const -> Result<String> {
    return utils::files::ReadTextFile(m_options.exeDir / "config" / fileName);
  }

  fn ConfigurationResolver::fetchRemote(const StringView fileName) -> Result<String> {
    Result<fs::path> targetDir = downloadDirectory();

    if (!targetDir)
      return Err(targetDir.error());

    Result<String> body = m_downloader(GetRemoteUrl(fileName));

    if (!body)
      return Err(body.error());

    const fs::path targetPath = *targetDir / fileName;

    if (Result<> written = utils::files::WriteTextFile(targetPath, *body); !written)
      return Err(written.error());

    return utils::files::ReadTextFile(targetPath);
  }

  fn ConfigurationResolver::readEmbedded(const StringView fileName) const -> Result<String> {
    const String resourceName = GetResourceName(fileName);

    if (!m_embedded)
      ERR_FMT(NotFound, "Embedded resource '{}' not found", resourceName);

    if (Option<StringView> contents = m_embedded(resourceName))
      return String(*contents);

    ERR_FMT(NotFound, "Embedded resource '{}' not found", resourceName);
  }

  fn ConfigurationResolver::downloadDirectory() -> Result<fs::path> {
    if (m_options.useCache)
      return m_options.exeDir / "config";

    if (!m_downloadDir) {
      std::error_code errc;
      fs::path        tempDir = fs::temp_directory_path(errc);

      if (errc)
        return Err(TdcError(errc));

      m_downloadDir = tempDir / RandomDirectoryName() / "config";
    }

    return *m_downloadDir;
  }
} // namespace tdc::services::configuration
