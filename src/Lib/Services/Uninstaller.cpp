#include "TDC/Services/Uninstaller.hpp"

#include <condition_variable> // std::condition_variable_any
#include <future>             // std::{async, launch, future_status}
#include <mutex>              // std::unique_lock
#include <regex>              // std::{regex, smatch, regex_search}

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Logging.hpp"
#include "TDC/Utils/Types.hpp"

namespace tdc::services::uninstaller {
  namespace {
    using utils::error::TdcError;
    using enum utils::error::TdcErrorCode;

    using utils::logging::Print;
    using utils::logging::Println;

    using utils::types::Err;
    using utils::types::Future;
    using utils::types::Mutex;
    using utils::types::None;
    using utils::types::usize;
    using utils::types::Vec;

    using core::host::ProcessEntry;
    using core::host::ProcessId;
    using core::inventory::DriverPackage;
    using core::rules::UninstallMethod;

    constexpr StringView WHITESPACE = " \t\r\n";

    constexpr StringView USER_OVERRIDE_PROMPT =
      "Complete the uninstall process. If this message is not gone after uninstall is complete, then press any key to continue...";

    fn Trim(const StringView text) -> StringView {
      const usize first = text.find_first_not_of(WHITESPACE);

      if (first == StringView::npos)
        return {};

      const usize last = text.find_last_not_of(WHITESPACE);

      return text.substr(first, last - first + 1);
    }

    fn MakeArguments(const StringView rest) -> Option<String> {
      const StringView trimmed = Trim(rest);

      if (trimmed.empty())
        return None;

      return String(trimmed);
    }

    fn UninstallCommand(const DriverPackage& package) -> Result<StringView> {
      if (!package.uninstallString || Trim(*package.uninstallString).empty())
        ERR_FMT(AlreadyRemoved, "'{}' has no uninstall command", package.displayName.value_or(package.keyName));

      return StringView(*package.uninstallString);
    }
  } // namespace

  fn ParseInvocation(const StringView commandLine) -> Result<Invocation> {
    if (commandLine.empty())
      ERR(ParseError, "Uninstall command line is empty");

    const char first = commandLine.front();

    if (first != '"' && first != '\'') {
      const usize space = commandLine.find(' ');

      if (space == StringView::npos)
        return Invocation { .executable = String(commandLine), .arguments = None };

      return Invocation {
        .executable = String(commandLine.substr(0, space)),
        .arguments  = MakeArguments(commandLine.substr(space + 1)),
      };
    }

    bool escaped    = false;
    bool quoteEnded = false;

    for (usize i = 1; i < commandLine.size(); ++i) {
      const char chr = commandLine[i];

      if (chr == ' ' && !escaped && quoteEnded)
        return Invocation {
          .executable = String(commandLine.substr(0, i)),
          .arguments  = MakeArguments(commandLine.substr(i + 1)),
        };

      if (chr == first && !escaped)
        quoteEnded = !quoteEnded;
      else if (chr == '\\')
        escaped = !escaped;
      else
        escaped = false;
    }

    if (!quoteEnded)
      ERR_FMT(ParseError, "Unterminated quote in command line '{}'", commandLine);

    return Invocation { .executable = String(commandLine), .arguments = None };
  }

  fn ParseInvocationFallback(const StringView commandLine) -> Invocation {
    static const std::regex ExeBoundary(R"((.+?\.exe) (.*))", std::regex::ECMAScript | std::regex::icase);

    const String  subject(commandLine);
    std::smatch   match;

    if (std::regex_search(subject, match, ExeBoundary))
      return Invocation { .executable = match[1].str(), .arguments = MakeArguments(match[2].str()) };

    return Invocation { .executable = subject, .arguments = None };
  }

  fn StripQuotes(const StringView path) -> String {
    if (path.empty() || (path.front() != '"' && path.front() != '\''))
      return String(path);

    StringView inner = path.substr(1);

    if (!inner.empty() && inner.back() == path.front())
      inner.remove_suffix(1);

    return String(inner);
  }

  fn ContainingDirectory(const StringView path) -> String {
    const usize separator = path.find_last_of("\\/");

    if (separator == StringView::npos)
      return {};

    return String(path.substr(0, separator));
  }

  UninstallTracker::UninstallTracker(core::host::IHost& host, core::console::IConsole& console, const TrackerOptions options)
    : m_host(host), m_console(console), m_options(options) {}

  fn UninstallTracker::uninstall(const DriverPackage& package, const UninstallMethod method, const bool interactive) -> Result<> {
    if (method == UninstallMethod::RegistryOnly)
      return runRegistryOnly(package);

    const Fn<Result<>(std::stop_token)> strategy = [this, &package, method](const std::stop_token stopToken) -> Result<> {
      return method == UninstallMethod::Deferred ? runDeferred(package, stopToken) : runNormal(package, stopToken);
    };

    if (!interactive)
      return strategy(std::stop_token {});

    return race(strategy);
  }

  fn UninstallTracker::runNormal(const DriverPackage& package, const std::stop_token stopToken) -> Result<> {
    Result<StringView> command = UninstallCommand(package);

    if (!command)
      return Err(command.error());

    Result<ProcessId> pid = launch(*command);

    if (!pid)
      return Err(pid.error());

    return waitForDescendants(*pid, stopToken);
  }

  fn UninstallTracker::runDeferred(const DriverPackage& package, const std::stop_token stopToken) -> Result<> {
    Result<StringView> command = UninstallCommand(package);

    if (!command)
      return Err(command.error());

    Result<ProcessId> pid = launch(*command);

    if (!pid)
      return Err(pid.error());

    if (Result<> exited = m_host.waitForExit(*pid, stopToken); !exited)
      return exited;

    if (Result<> settled = settle(stopToken); !settled)
      return settled;

    Result<Invocation> invocation = ParseInvocation(*command);
    const String       executable = StripQuotes(invocation ? invocation->executable : ParseInvocationFallback(*command).executable);
    const String       targetDir  = ContainingDirectory(executable);

    Result<Option<ProcessId>> delegate = findDelegate(targetDir);

    if (!delegate)
      return Err(delegate.error());

    if (!*delegate) {
      debug_log("No process references '{}', the uninstaller already finished", targetDir);
      return {};
    }

    debug_log("Waiting for delegated uninstaller (pid {})", **delegate);

    return m_host.waitForExit(**delegate, stopToken);
  }

  fn UninstallTracker::runRegistryOnly(const DriverPackage& package) -> Result<> {
    debug_log("Deleting uninstall entry '{}' ({} view)", package.keyName, package.x86 ? "32-bit" : "64-bit");

    return m_host.deleteUninstallEntry(package);
  }

  fn UninstallTracker::race(const Fn<Result<>(std::stop_token)>& strategy) -> Result<> {
    std::stop_source stopSource;

    Print(USER_OVERRIDE_PROMPT);
    utils::logging::Flush();

    Future<Result<>> strategyTask = std::async(std::launch::async, strategy, stopSource.get_token());
    Future<Option<char>> userTask =
      std::async(std::launch::async, [this, stopToken = stopSource.get_token()] { return m_console.waitForKey(stopToken); });

    while (true) {
      if (strategyTask.wait_for(m_options.pollInterval) == std::future_status::ready) {
        stopSource.request_stop();
        userTask.wait();
        Println();

        return strategyTask.get();
      }

      if (userTask.wait_for(std::chrono::milliseconds::zero()) == std::future_status::ready) {
        stopSource.request_stop();
        Println();

        if (Result<> abandoned = strategyTask.get(); !abandoned && abandoned.error().code != Cancelled)
          debug_at(abandoned.error());

        debug_log("Uninstall wait ended by user");

        return {};
      }
    }
  }

  fn UninstallTracker::launch(const StringView uninstallString) -> Result<ProcessId> {
    if (Result<Invocation> invocation = ParseInvocation(uninstallString)) {
      Result<ProcessId> pid = m_host.launchProcess(StripQuotes(invocation->executable), invocation->arguments);

      if (pid)
        return pid;

      debug_at(pid.error());
    } else
      debug_at(invocation.error());

    const Invocation fallback = ParseInvocationFallback(uninstallString);

    Result<ProcessId> pid = m_host.launchProcess(StripQuotes(fallback.executable), fallback.arguments);

    if (!pid && pid.error().code == NotFound)
      ERR_FMT(AlreadyRemoved, "Uninstaller '{}' no longer exists", StripQuotes(fallback.executable));

    return pid;
  }

  fn UninstallTracker::waitForDescendants(const ProcessId pid, const std::stop_token stopToken) -> Result<> {
    Result<Vec<ProcessId>> children = m_host.childProcesses(pid);

    if (!children)
      return Err(children.error());

    const ProcessId self = m_host.currentProcessId();

    for (const ProcessId child : *children) {
      if (child == self)
        continue;

      if (Result<> waited = waitForDescendants(child, stopToken); !waited)
        return waited;
    }

    return m_host.waitForExit(pid, stopToken);
  }

  fn UninstallTracker::findDelegate(const StringView targetDir) -> Result<Option<ProcessId>> {
    if (targetDir.empty())
      return None;

    Result<Vec<ProcessEntry>> processes = m_host.processList();

    if (!processes)
      return Err(processes.error());

    const ProcessId self = m_host.currentProcessId();

    for (const ProcessEntry& entry : *processes)
      if (entry.pid != self && entry.commandLine && entry.commandLine->contains(targetDir))
        return entry.pid;

    return None;
  }

  fn UninstallTracker::settle(const std::stop_token stopToken) const -> Result<> {
    if (m_options.settleDelay <= std::chrono::milliseconds::zero())
      return {};

    Mutex                       mutex;
    std::condition_variable_any condition;
    std::unique_lock            lock(mutex);

    condition.wait_for(lock, stopToken, m_options.settleDelay, [] { return false; });

    if (stopToken.stop_requested())
      ERR(Cancelled, "Uninstall wait was cancelled");

    return {};
  }
} // namespace tdc::services::uninstaller
