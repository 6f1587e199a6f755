#include <TDC/Utils/Definitions.hpp>
#include <TDC/Utils/Logging.hpp>
#include <TDC/Utils/Types.hpp>

#include "gtest/gtest.h"

using tdc::utils::types::i32;

fn main(i32 argc, char** argv) -> i32 {
  testing::InitGoogleTest(&argc, argv);

  // Keep debug chatter from the code under test out of the test output.
  tdc::utils::logging::SetRuntimeLogLevel(tdc::utils::logging::LogLevel::Error);

  return RUN_ALL_TESTS();
}
