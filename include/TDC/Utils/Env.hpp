#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers)
#endif

#include <cstdlib>

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace tdc::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;
    using types::String;

    using error::TdcError;
    using enum error::TdcErrorCode;
  } // namespace

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing an owned copy of the variable's value.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char*       rawPtr     = nullptr;
    std::size_t bufferSize = 0;

    // Use _dupenv_s to safely retrieve environment variables on Windows
    const int err = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      return Err(TdcError(PermissionDenied, "Failed to retrieve environment variable"));

    if (!ptrManager)
      return Err(TdcError(NotFound, std::format("Environment variable '{}' not found", name)));

    return String(ptrManager.get());
#else
    // Use std::getenv to retrieve environment variables on POSIX systems
    const PCStr value = std::getenv(name);

    if (!value)
      return Err(TdcError(NotFound, std::format("Environment variable '{}' not found", name)));

    return String(value);
#endif
  }
} // namespace tdc::utils::env
