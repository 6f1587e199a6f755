#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::{error_code, system_category}

#ifdef _WIN32
  // ReSharper disable once CppUnusedIncludeDirective
  #include <winerror.h> // error values
#else
  #include <cerrno> // errno
#endif

#include "Definitions.hpp"
#include "Types.hpp"

namespace tdc::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::StringView;
      using types::u32;
      using types::u8;
    } // namespace

    /**
     * @enum TdcErrorCode
     * @brief Error codes shared by every layer of the cleanup engine.
     */
    enum class TdcErrorCode : u8 {
      AlreadyRemoved,     ///< The removal target no longer exists. Benign, processing continues.
      ApiUnavailable,     ///< A required OS service/API is unavailable or failed unexpectedly at runtime.
      Cancelled,          ///< The user cancelled the run from an interactive prompt.
      ConfigurationError, ///< No rule source could be resolved, or a rule file is invalid.
      CorruptedData,      ///< Data present but corrupt or inconsistent.
      InternalError,      ///< An error occurred within the application's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or on the command line.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NetworkError,       ///< A network-related error occurred (e.g., DNS resolution, connection failure).
      NotFound,           ///< A required resource (file, registry key, device, process) was not found.
      NotSupported,       ///< The requested operation is not supported on this platform.
      Other,              ///< A generic or unclassified error originating from the OS or an external library.
      OutOfMemory,        ///< The system ran out of memory or resources to complete the operation.
      ParseError,         ///< Failed to parse data (rule files, match patterns, invocation strings).
      PermissionDenied,   ///< Insufficient permissions to perform the operation.
      PermissionRequired, ///< Operation requires elevated privileges.
      PlatformSpecific,   ///< An unmapped error specific to the underlying OS platform occurred (check message).
      Timeout,            ///< An operation timed out.
    };

    /**
     * @struct TdcError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result across the library.
     */
    struct TdcError {
      String               message;  ///< A descriptive error message, potentially including platform details.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      TdcErrorCode         code;     ///< The general category of the error.

      TdcError(const TdcErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit TdcError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(TdcErrorCode::InternalError) {}

      explicit TdcError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum TdcErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | not_enough_memory                                                            = OutOfMemory,
          is | or_(operation_not_supported, not_supported)                                  = NotSupported,
          is | or_(network_unreachable, network_down, connection_refused)                   = NetworkError,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | timed_out                                                                    = Timeout,
          is | _                                                                            = errc.category() == std::generic_category() ? InternalError : PlatformSpecific
        );
      }

#ifdef _WIN32
      /**
       * @brief Builds an error from a Win32 error code (usually GetLastError()).
       * @param win32 The Win32 error code.
       * @param context What was being attempted, prepended to the system message.
       * @param loc Source location of the failure.
       */
      static fn fromWin32(const u32 win32, const StringView context, const std::source_location& loc = std::source_location::current()) -> TdcError {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum TdcErrorCode;

        const TdcErrorCode errc = match(win32)(
          is | static_cast<u32>(ERROR_ACCESS_DENIED)                                                = PermissionDenied,
          is | or_(static_cast<u32>(ERROR_FILE_NOT_FOUND), static_cast<u32>(ERROR_PATH_NOT_FOUND)) = NotFound,
          is | or_(static_cast<u32>(ERROR_TIMEOUT), static_cast<u32>(ERROR_SEM_TIMEOUT))           = Timeout,
          is | static_cast<u32>(ERROR_NOT_SUPPORTED)                                               = NotSupported,
          is | static_cast<u32>(ERROR_ELEVATION_REQUIRED)                                          = PermissionRequired,
          is | _                                                                                   = PlatformSpecific
        );

        return { errc, std::format("{}: {} (0x{:08X})", context, std::system_category().message(static_cast<int>(win32)), win32), loc };
      }
#else
      /**
       * @brief Builds an error from the current errno value.
       * @param context What was being attempted, prepended to the system message.
       * @param loc Source location of the failure.
       */
      static fn fromErrno(const StringView context, const std::source_location& loc = std::source_location::current()) -> TdcError {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum TdcErrorCode;

        const int savedErrno = errno;

        const TdcErrorCode errc = match(savedErrno)(
          is | or_(EACCES, EPERM)                       = PermissionDenied,
          is | or_(ENOENT, ESRCH)                       = NotFound,
          is | ETIMEDOUT                                = Timeout,
          is | ENOTSUP                                  = NotSupported,
          is | EIO                                      = IoError,
          is | or_(ECONNREFUSED, ENETDOWN, ENETUNREACH) = NetworkError,
          is | _                                        = PlatformSpecific
        );

        return { errc, std::format("{}: {}", context, std::system_category().message(savedErrno)), loc };
      }
#endif
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::TdcError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::TdcError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace tdc::utils

namespace std {
  template <>
  struct formatter<::tdc::utils::error::TdcErrorCode> : formatter<::tdc::utils::types::StringView> {
    template <typename FormatContext>
    fn format(tdc::utils::error::TdcErrorCode code, FormatContext& ctx) const {
      using enum tdc::utils::error::TdcErrorCode;
      using matchit::match, matchit::is, matchit::_;

      tdc::utils::types::StringView name = match(code)(
        is | AlreadyRemoved     = "AlreadyRemoved",
        is | ApiUnavailable     = "ApiUnavailable",
        is | Cancelled          = "Cancelled",
        is | ConfigurationError = "ConfigurationError",
        is | CorruptedData      = "CorruptedData",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NetworkError       = "NetworkError",
        is | NotFound           = "NotFound",
        is | NotSupported       = "NotSupported",
        is | Other              = "Other",
        is | OutOfMemory        = "OutOfMemory",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | PermissionRequired = "PermissionRequired",
        is | PlatformSpecific   = "PlatformSpecific",
        is | Timeout            = "Timeout",
        is | _                  = "Unknown"
      );

      return formatter<tdc::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::tdc::utils::types::Err(::tdc::utils::error::TdcError(errc, msg))
#define ERR_FROM(err)           return ::tdc::utils::types::Err(::tdc::utils::error::TdcError(err))
#define ERR_FMT(errc, fmt, ...) return ::tdc::utils::types::Err(::tdc::utils::error::TdcError(errc, std::format(fmt, __VA_ARGS__)))
