#include <chrono>     // std::chrono_literals
#include <stop_token> // std::stop_source
#include <thread>     // std::jthread, std::this_thread::sleep_for

#ifdef __linux__
  #include <fcntl.h>  // open, O_RDONLY
  #include <unistd.h> // dup, dup2, close, STDIN_FILENO
#endif

#include <TDC/Core/Console.hpp>
#include <TDC/Core/Host.hpp>

#include <TDC/Utils/Error.hpp>
#include <TDC/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace std::chrono_literals;
using namespace tdc::utils::types;

using tdc::core::console::CreateConsole;
using tdc::core::console::IConsole;
using tdc::core::host::CreateHost;
using tdc::core::host::IHost;
using tdc::core::host::ProcessId;
using enum tdc::utils::error::TdcErrorCode;

class PlatformHostTest : public testing::Test {
 protected:
  UniquePointer<IHost> m_host = CreateHost();
};

#ifdef __linux__

TEST_F(PlatformHostTest, LaunchesBareNameFoundOnPath) {
  Result<ProcessId> pid = m_host->launchProcess("true", None);

  ASSERT_TRUE(pid) << pid.error().message;
  EXPECT_TRUE(m_host->waitForExit(*pid, std::stop_token {}));
}

TEST_F(PlatformHostTest, LaunchesBareNameWithArguments) {
  Result<ProcessId> pid = m_host->launchProcess("sh", "-c true");

  ASSERT_TRUE(pid) << pid.error().message;
  EXPECT_TRUE(m_host->waitForExit(*pid, std::stop_token {}));
}

TEST_F(PlatformHostTest, MissingExecutableIsNotFound) {
  Result<ProcessId> bare = m_host->launchProcess("tdc-no-such-uninstaller", None);

  ASSERT_FALSE(bare);
  EXPECT_EQ(bare.error().code, NotFound);

  Result<ProcessId> absolute = m_host->launchProcess("/nonexistent/tdc/uninstall", None);

  ASSERT_FALSE(absolute);
  EXPECT_EQ(absolute.error().code, NotFound);
}

class PlatformConsoleTest : public testing::Test {
 protected:
  UniquePointer<IConsole> m_console = CreateConsole();

  i32 m_savedStdin = -1;

  fn SetUp() -> void override {
    m_savedStdin = dup(STDIN_FILENO);
    ASSERT_NE(m_savedStdin, -1);

    const i32 devNull = open("/dev/null", O_RDONLY);
    ASSERT_NE(devNull, -1);
    ASSERT_NE(dup2(devNull, STDIN_FILENO), -1);
    close(devNull);
  }

  fn TearDown() -> void override {
    if (m_savedStdin != -1) {
      dup2(m_savedStdin, STDIN_FILENO);
      close(m_savedStdin);
    }
  }
};

TEST_F(PlatformConsoleTest, WaitForKeyReturnsAtEndOfInput) {
  EXPECT_FALSE(m_console->waitForKey(std::stop_token {}).has_value());
}

TEST_F(PlatformConsoleTest, StoppableWaitAtEndOfInputLastsUntilStopped) {
  std::stop_source stopSource;

  std::jthread stopper([&stopSource] {
    std::this_thread::sleep_for(50ms);
    stopSource.request_stop();
  });

  EXPECT_FALSE(m_console->waitForKey(stopSource.get_token()).has_value());
  EXPECT_TRUE(stopSource.stop_requested());
}

TEST_F(PlatformConsoleTest, ConfirmAtEndOfInputCancels) {
  EXPECT_EQ(m_console->confirm("Remove 'Huion Tablet'?"), tdc::core::console::PromptResult::Cancel);
}

#endif // __linux__

#ifdef _WIN32

TEST_F(PlatformHostTest, LaunchesBareNameFoundOnPath) {
  Result<ProcessId> pid = m_host->launchProcess("cmd.exe", "/c exit 0");

  ASSERT_TRUE(pid) << pid.error().message;
  EXPECT_TRUE(m_host->waitForExit(*pid, std::stop_token {}));
}

TEST_F(PlatformHostTest, WaitsOnLaunchedProcessAfterItExits) {
  Result<ProcessId> pid = m_host->launchProcess("cmd.exe", "/c exit 0");

  ASSERT_TRUE(pid) << pid.error().message;

  std::this_thread::sleep_for(500ms);

  EXPECT_TRUE(m_host->waitForExit(*pid, std::stop_token {}));
}

TEST_F(PlatformHostTest, MissingExecutableIsNotFound) {
  Result<ProcessId> missing = m_host->launchProcess("tdc-no-such-uninstaller.exe", None);

  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, NotFound);
}

#endif // _WIN32
