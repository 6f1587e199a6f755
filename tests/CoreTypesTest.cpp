#include <format>       // std::format
#include <stdexcept>    // std::runtime_error
#include <system_error> // std::{make_error_code, errc}

#include <TDC/Utils/Error.hpp>
#include <TDC/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace tdc::utils::types;
using tdc::utils::error::TdcError;
using enum tdc::utils::error::TdcErrorCode;

namespace {
  fn FailPlain() -> Result<i32> {
    ERR(NotFound, "missing");
  }

  fn FailFormatted(const i32 pid) -> Result<> {
    ERR_FMT(Timeout, "Process {} did not exit", pid);
  }

  fn FailFromErrorCode() -> Result<String> {
    ERR_FROM(std::make_error_code(std::errc::permission_denied));
  }

  fn Succeed(const bool fail) -> Result<i32> {
    if (fail)
      ERR(InternalError, "asked to fail");

    return 7;
  }
} // namespace

class CoreTypesTest : public testing::Test {};

TEST_F(CoreTypesTest, ErrorCodeFormatter) {
  EXPECT_EQ(std::format("{}", AlreadyRemoved), "AlreadyRemoved");
  EXPECT_EQ(std::format("{}", Cancelled), "Cancelled");
  EXPECT_EQ(std::format("{}", ConfigurationError), "ConfigurationError");
  EXPECT_EQ(std::format("{}", ParseError), "ParseError");
  EXPECT_EQ(std::format("[{:>10}]", NotFound), "[  NotFound]");
}

TEST_F(CoreTypesTest, ErrMacroCarriesCodeAndMessage) {
  Result<i32> result = FailPlain();

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, NotFound);
  EXPECT_EQ(result.error().message, "missing");
  EXPECT_NE(String(result.error().location.function_name()).find("FailPlain"), String::npos);
}

TEST_F(CoreTypesTest, ErrFmtMacroFormatsMessage) {
  Result<> result = FailFormatted(4242);

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, Timeout);
  EXPECT_EQ(result.error().message, "Process 4242 did not exit");
}

TEST_F(CoreTypesTest, ErrFromMapsStandardErrorCodes) {
  Result<String> result = FailFromErrorCode();

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, PermissionDenied);
}

TEST_F(CoreTypesTest, ErrorCodeMapping) {
  EXPECT_EQ(TdcError(std::make_error_code(std::errc::no_such_file_or_directory)).code, NotFound);
  EXPECT_EQ(TdcError(std::make_error_code(std::errc::timed_out)).code, Timeout);
  EXPECT_EQ(TdcError(std::make_error_code(std::errc::io_error)).code, IoError);
  EXPECT_EQ(TdcError(std::make_error_code(std::errc::not_supported)).code, NotSupported);
  EXPECT_EQ(TdcError(std::make_error_code(std::errc::connection_refused)).code, NetworkError);
  EXPECT_EQ(TdcError(std::make_error_code(std::errc::bad_address)).code, InternalError);
}

TEST_F(CoreTypesTest, ExceptionBecomesInternalError) {
  const TdcError error(std::runtime_error("boom"));

  EXPECT_EQ(error.code, InternalError);
  EXPECT_EQ(error.message, "boom");
}

TEST_F(CoreTypesTest, ResultHoldsValueOnSuccess) {
  Result<i32> success = Succeed(false);
  Result<i32> failure = Succeed(true);

  ASSERT_TRUE(success);
  EXPECT_EQ(*success, 7);
  ASSERT_FALSE(failure);
  EXPECT_EQ(failure.error().code, InternalError);
}
