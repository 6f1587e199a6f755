#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Types.hpp"

namespace Curl {
  namespace {
    using tdc::utils::error::TdcError;
    using enum tdc::utils::error::TdcErrorCode;

    using tdc::utils::types::Err;
    using tdc::utils::types::i32;
    using tdc::utils::types::i64;
    using tdc::utils::types::None;
    using tdc::utils::types::Option;
    using tdc::utils::types::RawPointer;
    using tdc::utils::types::Result;
    using tdc::utils::types::String;
    using tdc::utils::types::Unit;
    using tdc::utils::types::usize;
  } // namespace

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String> url                = None;    ///< URL to set for the transfer
    String*        writeBuffer        = nullptr; ///< Pointer to a string buffer to store the response
    Option<i64>    timeoutSecs        = None;    ///< Timeout for the entire request in seconds
    Option<i64>    connectTimeoutSecs = None;    ///< Timeout for the connection phase in seconds
    Option<String> userAgent          = None;    ///< User-agent string
    bool           followRedirects    = true;    ///< Whether 3xx responses are followed
  };

  /**
   * @brief RAII wrapper for CURL easy handle.
   */
  class Easy {
    CURL*            m_curl      = nullptr;
    Option<TdcError> m_initError = None; ///< Stores any error that occurred during initialization via options constructor

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    fn applyOptions(const EasyOptions& options) -> Result<> {
      if (options.url)
        if (Result res = setUrl(*options.url); !res)
          return res;

      if (options.writeBuffer)
        if (Result res = setWriteFunction(options.writeBuffer); !res)
          return res;

      if (options.timeoutSecs)
        if (Result res = setOpt(CURLOPT_TIMEOUT, *options.timeoutSecs); !res)
          return res;

      if (options.connectTimeoutSecs)
        if (Result res = setOpt(CURLOPT_CONNECTTIMEOUT, *options.connectTimeoutSecs); !res)
          return res;

      if (options.userAgent)
        if (Result res = setOpt(CURLOPT_USERAGENT, options.userAgent->c_str()); !res)
          return res;

      return setOpt(CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    }

   public:
    /**
     * @brief Constructor with options. Initializes a CURL easy handle and sets options.
     * @param options The options to configure the CURL handle.
     */
    explicit Easy(const EasyOptions& options)
      : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = TdcError(ApiUnavailable, "curl_easy_init() failed");
        return;
      }

      if (Result res = applyOptions(options); !res)
        m_initError = res.error();
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    // Non-copyable
    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);
        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    /**
     * @brief Checks if the CURL handle is valid and initialized without errors.
     */
    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const Option<TdcError>& {
      return m_initError;
    }

    /**
     * @brief Sets a CURL option.
     * @tparam T The type of the option value.
     * @param option The CURL option to set.
     * @param value The value to set for the option.
     * @return A Result indicating success or failure.
     */
    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking transfer.
     * @return A NetworkError if the transfer itself failed.
     */
    fn perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK)
        ERR_FMT(NetworkError, "curl_easy_perform failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Returns the HTTP status code of the last transfer.
     */
    fn responseCode() -> Result<i64> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      long code = 0;

      if (const CURLcode res = curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &code); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return static_cast<i64>(code);
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    fn setWriteFunction(String* buffer) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }
  };

  /**
   * @brief Downloads @p url into memory.
   * @param url The URL to fetch.
   * @param userAgent The user agent to send.
   * @return The response body, or a NetworkError for transport failures and non-2xx responses.
   */
  inline fn Download(const String& url, const String& userAgent) -> Result<String> {
    String responseBuffer;

    Easy curl({
      .url                = url,
      .writeBuffer        = &responseBuffer,
      .timeoutSecs        = 10L,
      .connectTimeoutSecs = 5L,
      .userAgent          = userAgent,
    });

    if (!curl) {
      if (const Option<TdcError>& initError = curl.getInitializationError())
        return Err(*initError);

      ERR(ApiUnavailable, "Failed to initialize cURL (Easy handle is invalid after construction)");
    }

    if (Result res = curl.perform(); !res)
      return Err(res.error());

    Result<i64> status = curl.responseCode();

    if (!status)
      return Err(status.error());

    if (*status < 200 || *status >= 300)
      ERR_FMT(NetworkError, "GET {} returned HTTP {}", url, *status);

    return responseBuffer;
  }

  /**
   * @brief Initializes CURL globally. Should be called once at the start of the program.
   * @param flags CURL global init flags.
   * @return A Result indicating success or failure.
   */
  inline fn GlobalInit(const i32 flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(PlatformSpecific, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }

  /**
   * @brief Cleans up CURL globally. Should be called once at the end of the program.
   */
  inline fn GlobalCleanup() -> Unit {
    curl_global_cleanup();
  }
} // namespace Curl
