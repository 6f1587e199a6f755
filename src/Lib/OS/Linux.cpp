#ifdef __linux__

  #include <charconv>     // std::from_chars
  #include <chrono>       // std::chrono::milliseconds
  #include <csignal>      // kill
  #include <filesystem>   // std::filesystem::{exists, is_regular_file, directory_iterator}
  #include <fstream>      // std::ifstream
  #include <iterator>     // std::istreambuf_iterator
  #include <poll.h>       // poll, pollfd, POLLIN
  #include <ranges>       // std::views::split
  #include <spawn.h>      // posix_spawn
  #include <sys/wait.h>   // waitpid, WNOHANG
  #include <termios.h>    // tcgetattr, tcsetattr, termios
  #include <thread>       // std::this_thread::sleep_for
  #include <unistd.h>     // access, getpid, geteuid, read, STDIN_FILENO

  #include "TDC/Core/Console.hpp"
  #include "TDC/Core/Host.hpp"
  #include "TDC/Core/Inventory.hpp"

  #include "TDC/Utils/Env.hpp"
  #include "TDC/Utils/Error.hpp"
  #include "TDC/Utils/Logging.hpp"
  #include "TDC/Utils/Types.hpp"

extern char** environ; // NOLINT(readability-identifier-naming)

using tdc::utils::error::TdcError;
using enum tdc::utils::error::TdcErrorCode;
using namespace tdc::utils::types;
namespace fs = std::filesystem;

namespace {
  using tdc::core::console::IConsole;
  using tdc::core::console::PromptResult;
  using tdc::core::host::IHost;
  using tdc::core::host::ProcessEntry;
  using tdc::core::host::ProcessId;
  using tdc::core::host::RemovalOutcome;
  using tdc::core::inventory::Device;
  using tdc::core::inventory::Driver;
  using tdc::core::inventory::DriverPackage;
  using tdc::core::inventory::IInventoryProvider;

  constexpr std::chrono::milliseconds POLL_INTERVAL { 20 };

  template <std::integral T>
  fn try_parse(const StringView sview) -> Option<T> {
    T value;

    auto [ptr, ec] = std::from_chars(sview.data(), sview.data() + sview.size(), value);

    if (ec == std::errc() && ptr == sview.data() + sview.size())
      return value;

    return None;
  }

  // Names without a slash are looked up on PATH the way the shell's exec does.
  fn ResolveExecutable(const String& executable) -> Option<fs::path> {
    std::error_code errc;

    if (executable.empty())
      return None;

    if (executable.contains('/'))
      return fs::exists(executable, errc) ? Option<fs::path>(executable) : None;

    const Result<String> searchPath = tdc::utils::env::GetEnv("PATH");

    if (!searchPath)
      return None;

    for (const auto& entry : std::views::split(StringView(*searchPath), ':')) {
      const StringView directory(entry.begin(), entry.end());
      const fs::path   candidate = fs::path(directory.empty() ? "." : directory) / executable;

      if (fs::is_regular_file(candidate, errc) && access(candidate.c_str(), X_OK) == 0)
        return candidate;
    }

    return None;
  }

  /**
   * @brief Fields of /proc/<pid>/stat needed for process tracking.
   */
  struct ProcStat {
    ProcessId parentPid = 0;
    char      state     = '?';
  };

  // The command name is wrapped in parentheses and may itself contain spaces or ')',
  // so the fixed fields start after the last ')'.
  fn ReadProcStat(const ProcessId pid) -> Option<ProcStat> {
    std::ifstream file(std::format("/proc/{}/stat", pid));

    if (!file)
      return None;

    String line;

    if (!std::getline(file, line))
      return None;

    const usize commEnd = line.rfind(')');

    if (commEnd == String::npos || commEnd + 4 >= line.size())
      return None;

    const StringView rest(line.data() + commEnd + 2, line.size() - commEnd - 2);

    const usize ppidStart = rest.find(' ');

    if (ppidStart == StringView::npos)
      return None;

    const usize      ppidEnd = rest.find(' ', ppidStart + 1);
    const StringView ppidStr = rest.substr(ppidStart + 1, ppidEnd == StringView::npos ? StringView::npos : ppidEnd - ppidStart - 1);

    const Option<ProcessId> parentPid = try_parse<ProcessId>(ppidStr);

    if (!parentPid)
      return None;

    return ProcStat { .parentPid = *parentPid, .state = rest.front() };
  }

  fn ReadCommandLine(const ProcessId pid) -> Option<String> {
    std::ifstream file(std::format("/proc/{}/cmdline", pid), std::ios::binary);

    if (!file)
      return None;

    String contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    while (!contents.empty() && contents.back() == '\0')
      contents.pop_back();

    if (contents.empty())
      return None;

    for (char& chr : contents)
      if (chr == '\0')
        chr = ' ';

    return contents;
  }

  fn ListPids() -> Result<Vec<ProcessId>> {
    std::error_code errc;

    fs::directory_iterator iter("/proc", errc);

    if (errc)
      ERR_FROM(errc);

    Vec<ProcessId> pids;

    for (const fs::directory_entry& entry : iter)
      if (const Option<ProcessId> pid = try_parse<ProcessId>(entry.path().filename().string()))
        pids.push_back(*pid);

    return pids;
  }

  class LinuxInventoryProvider final : public IInventoryProvider {
   public:
    [[nodiscard]] fn enumerateDevices() const -> Result<Vec<Device>> override {
      ERR(NotSupported, "Device enumeration requires the Windows setup API");
    }

    [[nodiscard]] fn enumerateDrivers() const -> Result<Vec<Driver>> override {
      ERR(NotSupported, "Driver enumeration requires the Windows driver store");
    }

    [[nodiscard]] fn enumerateDriverPackages() const -> Result<Vec<DriverPackage>> override {
      ERR(NotSupported, "Driver package enumeration requires the Windows registry");
    }
  };

  class LinuxHost final : public IHost {
   public:
    [[nodiscard]] fn removeDevice(const Device& device) -> Result<RemovalOutcome> override {
      ERR_FMT(NotSupported, "Cannot remove device '{}' on this platform", device.instanceId);
    }

    [[nodiscard]] fn removeDriver(const Driver& driver) -> Result<RemovalOutcome> override {
      ERR_FMT(NotSupported, "Cannot remove driver '{}' on this platform", driver.infName);
    }

    [[nodiscard]] fn deleteUninstallEntry(const DriverPackage& package) -> Result<> override {
      ERR_FMT(NotSupported, "Cannot delete uninstall entry '{}' on this platform", package.keyName);
    }

    // The argument string is handed to the shell unquoted so it is split like a command line.
    [[nodiscard]] fn launchProcess(const String& executable, const Option<String>& arguments) -> Result<ProcessId> override {
      if (!ResolveExecutable(executable))
        ERR_FMT(NotFound, "Executable '{}' does not exist", executable);

      String script = "exec \"$0\" $1";
      String shell  = "/bin/sh";
      String flag   = "-c";
      String exe    = executable;
      String args   = arguments.value_or("");

      Array<char*, 6> argv = { shell.data(), flag.data(), script.data(), exe.data(), args.data(), nullptr };

      pid_t pid = 0;

      if (const int result = posix_spawn(&pid, shell.c_str(), nullptr, nullptr, argv.data(), environ); result != 0) {
        errno = result;
        return Err(TdcError::fromErrno(std::format("Failed to start '{}'", executable)));
      }

      debug_log("Started '{}' (pid {})", executable, pid);

      return static_cast<ProcessId>(pid);
    }

    [[nodiscard]] fn childProcesses(const ProcessId pid) -> Result<Vec<ProcessId>> override {
      Result<Vec<ProcessId>> pids = ListPids();

      if (!pids)
        return Err(pids.error());

      Vec<ProcessId> children;

      for (const ProcessId candidate : *pids)
        if (const Option<ProcStat> stat = ReadProcStat(candidate); stat && stat->parentPid == pid && candidate != pid)
          children.push_back(candidate);

      return children;
    }

    [[nodiscard]] fn processList() -> Result<Vec<ProcessEntry>> override {
      Result<Vec<ProcessId>> pids = ListPids();

      if (!pids)
        return Err(pids.error());

      Vec<ProcessEntry> processes;
      processes.reserve(pids->size());

      for (const ProcessId pid : *pids) {
        const Option<ProcStat> stat = ReadProcStat(pid);

        // Exited between listing and reading.
        if (!stat)
          continue;

        processes.push_back(ProcessEntry { .pid = pid, .parentPid = stat->parentPid, .commandLine = ReadCommandLine(pid) });
      }

      return processes;
    }

    [[nodiscard]] fn waitForExit(const ProcessId pid, const std::stop_token stopToken) -> Result<> override {
      const auto nativePid = static_cast<pid_t>(pid);

      while (!stopToken.stop_requested()) {
        int         status = 0;
        const pid_t reaped = waitpid(nativePid, &status, WNOHANG);

        if (reaped == nativePid)
          return {};

        // Not our child, so it cannot be reaped here; poll for its existence instead.
        if (reaped == -1) {
          if (errno != ECHILD)
            return Err(TdcError::fromErrno(std::format("Failed to wait for process {}", pid)));

          if (kill(nativePid, 0) == -1 && errno == ESRCH)
            return {};

          if (const Option<ProcStat> stat = ReadProcStat(pid); !stat || stat->state == 'Z')
            return {};
        }

        std::this_thread::sleep_for(POLL_INTERVAL);
      }

      ERR_FMT(Cancelled, "Wait for process {} was cancelled", pid);
    }

    [[nodiscard]] fn currentProcessId() const -> ProcessId override {
      return static_cast<ProcessId>(getpid());
    }

    [[nodiscard]] fn isElevated() const -> Result<bool> override {
      return geteuid() == 0;
    }

    [[nodiscard]] fn reboot() -> Result<> override {
      ERR(NotSupported, "Rebooting is only supported on Windows");
    }
  };

  /**
   * @brief Puts the terminal into non-canonical, no-echo mode for its lifetime.
   *
   * Does nothing when stdin is not a terminal.
   */
  class RawTerminal {
   public:
    RawTerminal() {
      if (tcgetattr(STDIN_FILENO, &m_original) != 0)
        return;

      termios raw  = m_original;
      raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
      raw.c_cc[VMIN]  = 1;
      raw.c_cc[VTIME] = 0;

      m_active = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
    }

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal(RawTerminal&&)      = delete;

    fn operator=(const RawTerminal&)->RawTerminal& = delete;
    fn operator=(RawTerminal&&)->RawTerminal&      = delete;

    ~RawTerminal() {
      if (m_active)
        tcsetattr(STDIN_FILENO, TCSANOW, &m_original);
    }

   private:
    termios m_original {};
    bool    m_active = false;
  };

  class LinuxConsole final : public IConsole {
   public:
    fn confirm(const StringView question) -> PromptResult override {
      using tdc::utils::logging::Print;
      using tdc::utils::logging::Println;

      Print("{} [Y/n/q] ", question);
      tdc::utils::logging::Flush();

      const RawTerminal raw;

      const Option<char> key = readKey();

      Println();

      // End of input behaves like Escape.
      if (!key || *key == 'q' || *key == 'Q' || *key == '\x1b')
        return PromptResult::Cancel;

      if (*key == 'y' || *key == 'Y' || *key == '\n' || *key == '\r')
        return PromptResult::Yes;

      return PromptResult::No;
    }

    fn waitForKey(const std::stop_token stopToken) -> Option<char> override {
      const RawTerminal raw;

      pollfd stdinPoll { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };

      while (!stopToken.stop_requested()) {
        const int ready = poll(&stdinPoll, 1, static_cast<int>(POLL_INTERVAL.count()));

        if (ready > 0) {
          if (const Option<char> key = readKey())
            return key;

          // stdin reached end of file; no key can arrive anymore. A stoppable wait
          // still lasts until stopped so it never reads as a keypress.
          if (!stopToken.stop_possible())
            return None;

          while (!stopToken.stop_requested())
            std::this_thread::sleep_for(POLL_INTERVAL);

          return None;
        }

        if (ready < 0 && errno != EINTR) {
          debug_at(TdcError::fromErrno("poll on stdin failed"));

          if (!stopToken.stop_possible())
            return None;

          std::this_thread::sleep_for(POLL_INTERVAL);
        }
      }

      return None;
    }

   private:
    static fn readKey() -> Option<char> {
      char key = 0;

      if (read(STDIN_FILENO, &key, 1) != 1)
        return None;

      return key;
    }
  };
} // namespace

namespace tdc::core::inventory {
  fn CreateInventoryProvider() -> UniquePointer<IInventoryProvider> {
    return std::make_unique<LinuxInventoryProvider>();
  }
} // namespace tdc::core::inventory

namespace tdc::core::host {
  fn CreateHost() -> UniquePointer<IHost> {
    return std::make_unique<LinuxHost>();
  }
} // namespace tdc::core::host

namespace tdc::core::console {
  fn CreateConsole() -> UniquePointer<IConsole> {
    return std::make_unique<LinuxConsole>();
  }
} // namespace tdc::core::console

#endif // __linux__
