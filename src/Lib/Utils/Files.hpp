#pragma once

#include <filesystem>   // std::filesystem::{path, create_directories, exists}
#include <fstream>      // std::{ifstream, ofstream}
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Types.hpp"

namespace tdc::utils::files {
  namespace {
    namespace fs = std::filesystem;

    using error::TdcError;
    using enum error::TdcErrorCode;

    using types::Err;
    using types::Result;
    using types::String;
    using types::StringView;
  } // namespace

  /**
   * @brief Reads a whole file into memory.
   * @return The contents, NotFound if the file does not exist, IoError if it cannot be read.
   */
  inline fn ReadTextFile(const fs::path& filePath) -> Result<String> {
    std::error_code errc;

    if (!fs::exists(filePath, errc)) {
      if (errc)
        return Err(TdcError(errc));

      ERR_FMT(NotFound, "File '{}' does not exist", filePath.string());
    }

    std::ifstream ifs(filePath, std::ios::binary);

    if (!ifs)
      ERR_FMT(IoError, "Failed to open '{}' for reading", filePath.string());

    String contents((std::istreambuf_iterator<char>(ifs)), {});

    if (ifs.bad())
      ERR_FMT(IoError, "Failed to read '{}'", filePath.string());

    return contents;
  }

  /**
   * @brief Replaces the contents of a file, creating parent directories as needed.
   */
  inline fn WriteTextFile(const fs::path& filePath, const StringView contents) -> Result<> {
    std::error_code errc;

    if (filePath.has_parent_path())
      if (fs::create_directories(filePath.parent_path(), errc); errc)
        return Err(TdcError(errc));

    std::ofstream ofs(filePath, std::ios::binary | std::ios::trunc);

    if (!ofs)
      ERR_FMT(IoError, "Failed to open '{}' for writing", filePath.string());

    ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));

    if (!ofs)
      ERR_FMT(IoError, "Failed to write '{}'", filePath.string());

    return {};
  }
} // namespace tdc::utils::files
