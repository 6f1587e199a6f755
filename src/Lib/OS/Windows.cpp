/**
 * @file   Windows.cpp
 * @brief  Windows implementation of the inventory provider, host operations and console.
 *
 * @details Devices are read through SetupAPI, third-party drivers from the
 * published `oem<N>.inf` files in `%WINDIR%\INF`, and driver packages from both
 * registry views of the Uninstall key. Removal goes through newdev.h
 * (DiUninstallDevice, DiUninstallDriverW) and the registry API.
 *
 * Wide strings are only used at the API boundary; everything handed back to
 * the engine is UTF-8.
 */

#ifdef _WIN32

  #include <windows.h>

  #include <cfgmgr32.h>   // CM_Get_Device_IDW
  #include <conio.h>      // _kbhit, _getch
  #include <newdev.h>     // DiUninstallDevice, DiUninstallDriverW
  #include <setupapi.h>   // SetupDi*, SetupOpenInfFileW, SetupGetLineTextW, SetupGetInfDriverStoreLocationW
  #include <thread>       // std::this_thread::sleep_for
  #include <tlhelp32.h>   // CreateToolhelp32Snapshot, PROCESSENTRY32W, Process32FirstW, Process32NextW, TH32CS_SNAPPROCESS
  #include <winerror.h>   // ERROR_SUCCESS, ERROR_FILE_NOT_FOUND, ERROR_NO_MORE_ITEMS
  #include <winternl.h>   // NtQueryInformationProcess, UNICODE_STRING

  #include "TDC/Core/Console.hpp"
  #include "TDC/Core/Host.hpp"
  #include "TDC/Core/Inventory.hpp"

  #include "TDC/Utils/Env.hpp"
  #include "TDC/Utils/Error.hpp"
  #include "TDC/Utils/Logging.hpp"
  #include "TDC/Utils/Types.hpp"

namespace {
  using tdc::utils::error::TdcError;
  using enum tdc::utils::error::TdcErrorCode;
  using namespace tdc::utils::types;

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

  namespace constants {
    constexpr PWCStr UNINSTALL_KEY         = LR"(SOFTWARE\Microsoft\Windows\CurrentVersion\Uninstall)";
    constexpr PCStr  UNINSTALL_KEY_NAME    = R"(SOFTWARE\Microsoft\Windows\CurrentVersion\Uninstall)";
    constexpr PCStr  UNINSTALL_KEY_NAME_32 = R"(SOFTWARE\WOW6432Node\Microsoft\Windows\CurrentVersion\Uninstall)";

    // ProcessCommandLineInformation, Windows 8.1 and later.
    constexpr i32 PROCESS_COMMAND_LINE_INFORMATION = 60;

    constexpr DWORD POLL_INTERVAL_MS = 20;
  } // namespace constants

  namespace helpers {
    fn ConvertWStringToUTF8(const std::wstring_view wstr) -> Result<String> {
      if (wstr.empty())
        return String {};

      const i32 sizeNeeded = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.length()), nullptr, 0, nullptr, nullptr);

      if (sizeNeeded == 0)
        return Err(TdcError::fromWin32(GetLastError(), "Failed to get buffer size for UTF-8 conversion"));

      String result(sizeNeeded, 0);

      if (WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.length()), result.data(), sizeNeeded, nullptr, nullptr) == 0)
        return Err(TdcError::fromWin32(GetLastError(), "Failed to convert wide string to UTF-8"));

      return result;
    }

    fn ConvertUTF8ToWString(const StringView str) -> Result<WString> {
      if (str.empty())
        return WString {};

      const i32 sizeNeeded = MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.length()), nullptr, 0);

      if (sizeNeeded == 0)
        return Err(TdcError::fromWin32(GetLastError(), "Failed to get buffer size for UTF-16 conversion"));

      WString result(sizeNeeded, 0);

      if (MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.length()), result.data(), sizeNeeded) == 0)
        return Err(TdcError::fromWin32(GetLastError(), "Failed to convert UTF-8 to wide string"));

      return result;
    }

    // Lossy conversion for optional string fields; an unconvertible value is dropped.
    fn ToOption(const Option<WString>& wide) -> Option<String> {
      if (!wide)
        return None;

      if (Result<String> utf8 = ConvertWStringToUTF8(*wide))
        return *utf8;

      return None;
    }

    fn FileNameOf(const WString& path) -> WString {
      const usize separator = path.find_last_of(L"\\/");
      return separator == WString::npos ? path : path.substr(separator + 1);
    }

    fn DirectoryOf(const WString& path) -> WString {
      const usize separator = path.find_last_of(L"\\/");
      return separator == WString::npos ? WString {} : path.substr(0, separator);
    }

    struct HandleCloser {
      fn operator()(HANDLE handle) const -> Unit {
        if (handle != nullptr && handle != INVALID_HANDLE_VALUE)
          CloseHandle(handle);
      }
    };

    using UniqueHandle = UniquePointer<std::remove_pointer_t<HANDLE>, HandleCloser>;

    struct RegKeyCloser {
      fn operator()(HKEY key) const -> Unit {
        if (key && key != INVALID_HANDLE_VALUE)
          RegCloseKey(key);
      }
    };

    using UniqueRegKey = UniquePointer<std::remove_pointer_t<HKEY>, RegKeyCloser>;

    struct DevInfoCloser {
      fn operator()(HDEVINFO set) const -> Unit {
        if (set != INVALID_HANDLE_VALUE)
          SetupDiDestroyDeviceInfoList(set);
      }
    };

    using UniqueDevInfo = UniquePointer<std::remove_pointer_t<HDEVINFO>, DevInfoCloser>;

    struct InfCloser {
      fn operator()(HINF inf) const -> Unit {
        if (inf != INVALID_HANDLE_VALUE)
          SetupCloseInfFile(inf);
      }
    };

    using UniqueInf = UniquePointer<std::remove_pointer_t<HINF>, InfCloser>;

    // Reads a string value from an open registry key.
    fn GetRegistryString(HKEY key, const PWCStr valueName) -> Option<WString> {
      DWORD sizeInBytes = 0;

      if (RegGetValueW(key, nullptr, valueName, RRF_RT_REG_SZ | RRF_RT_REG_EXPAND_SZ | RRF_NOEXPAND, nullptr, nullptr, &sizeInBytes) != ERROR_SUCCESS)
        return None;

      WString buffer(sizeInBytes / sizeof(wchar_t) + 1, L'\0');

      if (RegGetValueW(key, nullptr, valueName, RRF_RT_REG_SZ | RRF_RT_REG_EXPAND_SZ | RRF_NOEXPAND, nullptr, buffer.data(), &sizeInBytes) != ERROR_SUCCESS)
        return None;

      buffer.resize(wcsnlen(buffer.c_str(), buffer.size()));

      if (buffer.empty())
        return None;

      return buffer;
    }

    // Reads a REG_SZ / REG_MULTI_SZ device property as a list of strings.
    fn GetDeviceProperty(HDEVINFO set, SP_DEVINFO_DATA& data, const DWORD property) -> Vec<WString> {
      DWORD requiredSize = 0;
      DWORD type         = 0;

      SetupDiGetDeviceRegistryPropertyW(set, &data, property, &type, nullptr, 0, &requiredSize);

      if (requiredSize == 0)
        return {};

      Vec<BYTE> buffer(requiredSize + sizeof(wchar_t) * 2, 0);

      if (!SetupDiGetDeviceRegistryPropertyW(set, &data, property, &type, buffer.data(), requiredSize, nullptr))
        return {};

      Vec<WString> values;

      for (PWCStr cursor = reinterpret_cast<PWCStr>(buffer.data()); *cursor != L'\0'; cursor += wcslen(cursor) + 1) { // NOLINT(*-pro-type-reinterpret-cast)
        values.emplace_back(cursor);

        if (type != REG_MULTI_SZ)
          break;
      }

      return values;
    }

    fn GetSingleDeviceProperty(HDEVINFO set, SP_DEVINFO_DATA& data, const DWORD property) -> Option<WString> {
      Vec<WString> values = GetDeviceProperty(set, data, property);

      if (values.empty())
        return None;

      return std::move(values.front());
    }

    // Full path of an INF inside the driver store, e.g. C:\Windows\System32\DriverStore\FileRepository\foo.inf_amd64_...\foo.inf
    fn GetDriverStorePath(const WString& infName) -> Option<WString> {
      Array<wchar_t, MAX_PATH> buffer {};
      DWORD                    required = 0;

      if (!SetupGetInfDriverStoreLocationW(infName.c_str(), nullptr, nullptr, buffer.data(), static_cast<DWORD>(buffer.size()), &required))
        return None;

      return WString(buffer.data());
    }

    fn GetInfVersionValue(HINF inf, const PWCStr key) -> Option<WString> {
      Array<wchar_t, 512> buffer {};
      DWORD               required = 0;

      if (!SetupGetLineTextW(nullptr, inf, L"Version", key, buffer.data(), static_cast<DWORD>(buffer.size()), &required))
        return None;

      return WString(buffer.data());
    }

    fn GetCommandLineOf(const DWORD pid) -> Option<String> {
      const UniqueHandle process(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));

      if (!process)
        return None;

      ULONG size = 0;
      NtQueryInformationProcess(process.get(), static_cast<PROCESSINFOCLASS>(constants::PROCESS_COMMAND_LINE_INFORMATION), nullptr, 0, &size);

      if (size == 0)
        return None;

      Vec<BYTE> buffer(size, 0);

      if (NtQueryInformationProcess(process.get(), static_cast<PROCESSINFOCLASS>(constants::PROCESS_COMMAND_LINE_INFORMATION), buffer.data(), size, &size) < 0)
        return None;

      const auto* commandLine = reinterpret_cast<const UNICODE_STRING*>(buffer.data()); // NOLINT(*-pro-type-reinterpret-cast)

      if (commandLine->Buffer == nullptr || commandLine->Length == 0)
        return None;

      return ToOption(WString(commandLine->Buffer, commandLine->Length / sizeof(wchar_t)));
    }

    fn SnapshotProcesses() -> Result<Vec<Pair<DWORD, DWORD>>> {
      const UniqueHandle snapshot(CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));

      if (snapshot.get() == INVALID_HANDLE_VALUE)
        return Err(TdcError::fromWin32(GetLastError(), "Failed to create snapshot of processes"));

      PROCESSENTRY32W pe32;
      pe32.dwSize = sizeof(PROCESSENTRY32W);

      Vec<Pair<DWORD, DWORD>> processes;

      for (BOOL ok = Process32FirstW(snapshot.get(), &pe32); ok; ok = Process32NextW(snapshot.get(), &pe32))
        processes.emplace_back(pe32.th32ProcessID, pe32.th32ParentProcessID);

      return processes;
    }
  } // namespace helpers

  class WindowsInventoryProvider final : public IInventoryProvider {
   public:
    [[nodiscard]] fn enumerateDevices() const -> Result<Vec<Device>> override {
      using namespace helpers;

      const UniqueDevInfo set(SetupDiGetClassDevsW(nullptr, nullptr, nullptr, DIGCF_ALLCLASSES | DIGCF_PRESENT));

      if (set.get() == INVALID_HANDLE_VALUE)
        return Err(TdcError::fromWin32(GetLastError(), "SetupDiGetClassDevsW failed"));

      Vec<Device> devices;

      SP_DEVINFO_DATA data;
      data.cbSize = sizeof(SP_DEVINFO_DATA);

      for (DWORD index = 0; SetupDiEnumDeviceInfo(set.get(), index, &data); ++index) {
        Array<wchar_t, MAX_DEVICE_ID_LEN> instanceId {};

        if (!SetupDiGetDeviceInstanceIdW(set.get(), &data, instanceId.data(), static_cast<DWORD>(instanceId.size()), nullptr))
          continue;

        Device device;

        if (Result<String> id = ConvertWStringToUTF8(instanceId.data()))
          device.instanceId = *id;
        else
          continue;

        for (const WString& hardwareId : GetDeviceProperty(set.get(), data, SPDRP_HARDWAREID))
          if (Result<String> utf8 = ConvertWStringToUTF8(hardwareId))
            device.hardwareIds.push_back(*utf8);

        device.friendlyName = ToOption(GetSingleDeviceProperty(set.get(), data, SPDRP_FRIENDLYNAME));
        device.description  = ToOption(GetSingleDeviceProperty(set.get(), data, SPDRP_DEVICEDESC));
        device.manufacturer = ToOption(GetSingleDeviceProperty(set.get(), data, SPDRP_MFG));
        device.driverName   = ToOption(GetSingleDeviceProperty(set.get(), data, SPDRP_DRIVER));
        device.className    = ToOption(GetSingleDeviceProperty(set.get(), data, SPDRP_CLASS));
        device.classGuid    = ToOption(GetSingleDeviceProperty(set.get(), data, SPDRP_CLASSGUID)).value_or("");

        if (const UniqueRegKey driverKey(SetupDiOpenDevRegKey(set.get(), &data, DICS_FLAG_GLOBAL, 0, DIREG_DRV, KEY_READ));
            driverKey && driverKey.get() != INVALID_HANDLE_VALUE) {
          const Option<WString> infPath = GetRegistryString(driverKey.get(), L"InfPath");

          device.infName     = ToOption(infPath);
          device.infSection  = ToOption(GetRegistryString(driverKey.get(), L"InfSection"));
          device.infProvider = ToOption(GetRegistryString(driverKey.get(), L"ProviderName"));

          if (infPath) {
            device.generic = !(infPath->size() > 3 && _wcsnicmp(infPath->c_str(), L"oem", 3) == 0);

            if (const Option<WString> storePath = GetDriverStorePath(*infPath)) {
              device.infOriginalName     = ToOption(FileNameOf(*storePath));
              device.driverStoreLocation = ToOption(DirectoryOf(*storePath));
            }
          }
        }

        devices.push_back(std::move(device));
      }

      if (const DWORD lastError = GetLastError(); lastError != ERROR_NO_MORE_ITEMS && lastError != ERROR_SUCCESS)
        return Err(TdcError::fromWin32(lastError, "SetupDiEnumDeviceInfo failed"));

      return devices;
    }

    [[nodiscard]] fn enumerateDrivers() const -> Result<Vec<Driver>> override {
      using namespace helpers;

      Result<String> windir = tdc::utils::env::GetEnv("WINDIR");

      if (!windir)
        return Err(windir.error());

      Result<WString> infDir = ConvertUTF8ToWString(*windir + "\\INF");

      if (!infDir)
        return Err(infDir.error());

      WIN32_FIND_DATAW findData;

      const WString pattern = *infDir + L"\\oem*.inf";
      HANDLE        hFind   = FindFirstFileW(pattern.c_str(), &findData);

      if (hFind == INVALID_HANDLE_VALUE) {
        if (GetLastError() == ERROR_FILE_NOT_FOUND)
          return Vec<Driver> {};

        return Err(TdcError::fromWin32(GetLastError(), "FindFirstFileW failed"));
      }

      Vec<Driver> drivers;

      do {
        const WString infName(findData.cFileName);
        const WString infPath = *infDir + L"\\" + infName;

        Driver driver;

        if (Result<String> name = ConvertWStringToUTF8(infName))
          driver.infName = *name;
        else
          continue;

        if (const Option<WString> storePath = GetDriverStorePath(infPath)) {
          driver.infOriginalName     = ToOption(FileNameOf(*storePath));
          driver.driverStoreLocation = ToOption(DirectoryOf(*storePath));
        }

        if (const UniqueInf inf(SetupOpenInfFileW(infPath.c_str(), nullptr, INF_STYLE_WIN4, nullptr)); inf.get() != INVALID_HANDLE_VALUE) {
          driver.provider  = ToOption(GetInfVersionValue(inf.get(), L"Provider"));
          driver.className = ToOption(GetInfVersionValue(inf.get(), L"Class"));
          driver.classGuid = ToOption(GetInfVersionValue(inf.get(), L"ClassGUID")).value_or("");
        } else
          debug_log("Could not open '{}'", driver.infName);

        drivers.push_back(std::move(driver));
      } while (FindNextFileW(hFind, &findData));

      FindClose(hFind);

      return drivers;
    }

    [[nodiscard]] fn enumerateDriverPackages() const -> Result<Vec<DriverPackage>> override {
      Vec<DriverPackage> packages;

      if (Result<> res = readUninstallView(false, packages); !res)
        return Err(res.error());

      if (Result<> res = readUninstallView(true, packages); !res)
        return Err(res.error());

      return packages;
    }

   private:
    static fn readUninstallView(const bool x86, Vec<DriverPackage>& out) -> Result<> {
      using namespace helpers;

      HKEY rawKey = nullptr;

      if (const LSTATUS status = RegOpenKeyExW(HKEY_LOCAL_MACHINE, constants::UNINSTALL_KEY, 0, KEY_READ | (x86 ? KEY_WOW64_32KEY : KEY_WOW64_64KEY), &rawKey);
          status != ERROR_SUCCESS) {
        if (status == ERROR_FILE_NOT_FOUND)
          return {};

        return Err(TdcError::fromWin32(static_cast<u32>(status), "Failed to open the Uninstall key"));
      }

      const UniqueRegKey uninstallKey(rawKey);

      for (DWORD index = 0;; ++index) {
        Array<wchar_t, 256> subKeyName {};
        DWORD               nameLength = static_cast<DWORD>(subKeyName.size());

        const LSTATUS status = RegEnumKeyExW(uninstallKey.get(), index, subKeyName.data(), &nameLength, nullptr, nullptr, nullptr, nullptr);

        if (status == ERROR_NO_MORE_ITEMS)
          break;

        if (status != ERROR_SUCCESS)
          return Err(TdcError::fromWin32(static_cast<u32>(status), "Failed to enumerate the Uninstall key"));

        HKEY rawSubKey = nullptr;

        if (RegOpenKeyExW(uninstallKey.get(), subKeyName.data(), 0, KEY_READ, &rawSubKey) != ERROR_SUCCESS)
          continue;

        const UniqueRegKey subKey(rawSubKey);

        Result<String> name = ConvertWStringToUTF8(subKeyName.data());

        if (!name)
          continue;

        out.push_back(DriverPackage {
          .x86             = x86,
          .keyName         = std::format("{}\\{}", x86 ? constants::UNINSTALL_KEY_NAME_32 : constants::UNINSTALL_KEY_NAME, *name),
          .displayName     = ToOption(GetRegistryString(subKey.get(), L"DisplayName")),
          .displayVersion  = ToOption(GetRegistryString(subKey.get(), L"DisplayVersion")),
          .publisher       = ToOption(GetRegistryString(subKey.get(), L"Publisher")),
          .installLocation = ToOption(GetRegistryString(subKey.get(), L"InstallLocation")),
          .uninstallString = ToOption(GetRegistryString(subKey.get(), L"UninstallString")),
        });
      }

      return {};
    }
  };

  class WindowsHost final : public IHost {
   public:
    [[nodiscard]] fn removeDevice(const Device& device) -> Result<RemovalOutcome> override {
      using namespace helpers;

      const UniqueDevInfo set(SetupDiCreateDeviceInfoList(nullptr, nullptr));

      if (set.get() == INVALID_HANDLE_VALUE)
        return Err(TdcError::fromWin32(GetLastError(), "SetupDiCreateDeviceInfoList failed"));

      Result<WString> instanceId = ConvertUTF8ToWString(device.instanceId);

      if (!instanceId)
        return Err(instanceId.error());

      SP_DEVINFO_DATA data;
      data.cbSize = sizeof(SP_DEVINFO_DATA);

      if (!SetupDiOpenDeviceInfoW(set.get(), instanceId->c_str(), nullptr, 0, &data)) {
        const DWORD lastError = GetLastError();

        if (lastError == ERROR_NO_SUCH_DEVINST)
          ERR_FMT(AlreadyRemoved, "Device '{}' no longer exists", device.instanceId);

        return Err(TdcError::fromWin32(lastError, std::format("Failed to open device '{}'", device.instanceId)));
      }

      BOOL needReboot = FALSE;

      if (!DiUninstallDevice(nullptr, set.get(), &data, 0, &needReboot))
        return Err(TdcError::fromWin32(GetLastError(), std::format("Failed to uninstall device '{}'", device.instanceId)));

      return RemovalOutcome { .rebootRequired = needReboot != FALSE };
    }

    [[nodiscard]] fn removeDriver(const Driver& driver) -> Result<RemovalOutcome> override {
      using namespace helpers;

      if (!driver.driverStoreLocation || !driver.infOriginalName)
        ERR_FMT(AlreadyRemoved, "Driver '{}' is no longer in the driver store", driver.infName);

      Result<WString> infPath = ConvertUTF8ToWString(std::format("{}\\{}", *driver.driverStoreLocation, *driver.infOriginalName));

      if (!infPath)
        return Err(infPath.error());

      BOOL needReboot = FALSE;

      if (!DiUninstallDriverW(nullptr, infPath->c_str(), 0, &needReboot)) {
        const DWORD lastError = GetLastError();

        if (lastError == ERROR_FILE_NOT_FOUND || lastError == ERROR_PATH_NOT_FOUND)
          ERR_FMT(AlreadyRemoved, "Driver '{}' is no longer in the driver store", driver.infName);

        return Err(TdcError::fromWin32(lastError, std::format("Failed to uninstall driver '{}'", driver.infName)));
      }

      return RemovalOutcome { .rebootRequired = needReboot != FALSE };
    }

    [[nodiscard]] fn deleteUninstallEntry(const DriverPackage& package) -> Result<> override {
      using namespace helpers;

      const usize    separator = package.keyName.find_last_of('\\');
      const String   subKey    = separator == String::npos ? package.keyName : package.keyName.substr(separator + 1);
      Result<WString> wideKey  = ConvertUTF8ToWString(subKey);

      if (!wideKey)
        return Err(wideKey.error());

      HKEY rawKey = nullptr;

      if (const LSTATUS status = RegOpenKeyExW(
            HKEY_LOCAL_MACHINE,
            constants::UNINSTALL_KEY,
            0,
            DELETE | KEY_ENUMERATE_SUB_KEYS | KEY_QUERY_VALUE | KEY_SET_VALUE | (package.x86 ? KEY_WOW64_32KEY : KEY_WOW64_64KEY),
            &rawKey
          );
          status != ERROR_SUCCESS)
        return Err(TdcError::fromWin32(static_cast<u32>(status), "Failed to open the Uninstall key"));

      const UniqueRegKey uninstallKey(rawKey);

      if (const LSTATUS status = RegDeleteTreeW(uninstallKey.get(), wideKey->c_str()); status != ERROR_SUCCESS) {
        if (status == ERROR_FILE_NOT_FOUND)
          ERR_FMT(AlreadyRemoved, "Uninstall entry '{}' no longer exists", package.keyName);

        return Err(TdcError::fromWin32(static_cast<u32>(status), std::format("Failed to delete '{}'", package.keyName)));
      }

      return {};
    }

    [[nodiscard]] fn launchProcess(const String& executable, const Option<String>& arguments) -> Result<ProcessId> override {
      using namespace helpers;

      Result<WString> commandLine = ConvertUTF8ToWString(arguments ? std::format("\"{}\" {}", executable, *arguments) : std::format("\"{}\"", executable));

      if (!commandLine)
        return Err(commandLine.error());

      STARTUPINFOW startupInfo {};
      startupInfo.cb = sizeof(STARTUPINFOW);

      PROCESS_INFORMATION processInfo {};

      // No application name, so bare names like MsiExec.exe are searched for on PATH.
      if (!CreateProcessW(nullptr, commandLine->data(), nullptr, nullptr, FALSE, 0, nullptr, nullptr, &startupInfo, &processInfo))
        return Err(TdcError::fromWin32(GetLastError(), std::format("Failed to start '{}'", executable)));

      UniqueHandle       process(processInfo.hProcess);
      const UniqueHandle thread(processInfo.hThread);

      const auto pid = static_cast<ProcessId>(processInfo.dwProcessId);

      debug_log("Started '{}' (pid {})", executable, pid);

      {
        const LockGuard lock(m_launchedMutex);
        m_launched.insert_or_assign(pid, std::move(process));
      }

      return pid;
    }

    [[nodiscard]] fn childProcesses(const ProcessId pid) -> Result<Vec<ProcessId>> override {
      Result<Vec<Pair<DWORD, DWORD>>> snapshot = helpers::SnapshotProcesses();

      if (!snapshot)
        return Err(snapshot.error());

      Vec<ProcessId> children;

      for (const auto& [childPid, parentPid] : *snapshot)
        if (parentPid == pid && childPid != pid)
          children.push_back(childPid);

      return children;
    }

    [[nodiscard]] fn processList() -> Result<Vec<ProcessEntry>> override {
      Result<Vec<Pair<DWORD, DWORD>>> snapshot = helpers::SnapshotProcesses();

      if (!snapshot)
        return Err(snapshot.error());

      Vec<ProcessEntry> processes;
      processes.reserve(snapshot->size());

      for (const auto& [pid, parentPid] : *snapshot)
        processes.push_back(ProcessEntry { .pid = pid, .parentPid = parentPid, .commandLine = helpers::GetCommandLineOf(pid) });

      return processes;
    }

    [[nodiscard]] fn waitForExit(const ProcessId pid, const std::stop_token stopToken) -> Result<> override {
      helpers::UniqueHandle process = takeLaunchedHandle(pid);

      // Processes we did not start are opened by pid.
      if (!process)
        process.reset(OpenProcess(SYNCHRONIZE, FALSE, pid));

      // The process is already gone.
      if (!process)
        return {};

      while (!stopToken.stop_requested()) {
        const DWORD status = WaitForSingleObject(process.get(), constants::POLL_INTERVAL_MS);

        if (status == WAIT_OBJECT_0)
          return {};

        if (status == WAIT_FAILED)
          return Err(TdcError::fromWin32(GetLastError(), std::format("Failed to wait for process {}", pid)));
      }

      ERR_FMT(Cancelled, "Wait for process {} was cancelled", pid);
    }

    [[nodiscard]] fn currentProcessId() const -> ProcessId override {
      return GetCurrentProcessId();
    }

    [[nodiscard]] fn isElevated() const -> Result<bool> override {
      HANDLE rawToken = nullptr;

      if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &rawToken))
        return Err(TdcError::fromWin32(GetLastError(), "OpenProcessToken failed"));

      const helpers::UniqueHandle token(rawToken);

      TOKEN_ELEVATION elevation {};
      DWORD           size = 0;

      if (!GetTokenInformation(token.get(), TokenElevation, &elevation, sizeof(elevation), &size))
        return Err(TdcError::fromWin32(GetLastError(), "GetTokenInformation failed"));

      return elevation.TokenIsElevated != 0;
    }

    [[nodiscard]] fn reboot() -> Result<> override {
      WString commandLine = L"shutdown /r /t 0";

      STARTUPINFOW startupInfo {};
      startupInfo.cb = sizeof(STARTUPINFOW);

      PROCESS_INFORMATION processInfo {};

      if (!CreateProcessW(nullptr, commandLine.data(), nullptr, nullptr, FALSE, CREATE_NO_WINDOW, nullptr, nullptr, &startupInfo, &processInfo))
        return Err(TdcError::fromWin32(GetLastError(), "Failed to run shutdown"));

      const helpers::UniqueHandle process(processInfo.hProcess);
      const helpers::UniqueHandle thread(processInfo.hThread);

      return {};
    }

   private:
    Mutex                                          m_launchedMutex;
    UnorderedMap<ProcessId, helpers::UniqueHandle> m_launched;

    // Handles of launched processes stay open until waited on, so their pids cannot be reused meanwhile.
    fn takeLaunchedHandle(const ProcessId pid) -> helpers::UniqueHandle {
      const LockGuard lock(m_launchedMutex);

      const auto iter = m_launched.find(pid);

      if (iter == m_launched.end())
        return helpers::UniqueHandle(nullptr);

      helpers::UniqueHandle handle = std::move(iter->second);
      m_launched.erase(iter);

      return handle;
    }
  };

  class WindowsConsole final : public IConsole {
   public:
    fn confirm(const StringView question) -> PromptResult override {
      using tdc::utils::logging::Print;
      using tdc::utils::logging::Println;

      Print("{} [Y/n/q] ", question);
      tdc::utils::logging::Flush();

      const i32 key = readKey();

      Println();

      if (key == 'y' || key == 'Y' || key == '\r' || key == '\n')
        return PromptResult::Yes;

      if (key == 'q' || key == 'Q' || key == 27)
        return PromptResult::Cancel;

      return PromptResult::No;
    }

    fn waitForKey(const std::stop_token stopToken) -> Option<char> override {
      while (!stopToken.stop_requested()) {
        if (_kbhit())
          return static_cast<char>(readKey());

        std::this_thread::sleep_for(std::chrono::milliseconds(constants::POLL_INTERVAL_MS));
      }

      return None;
    }

   private:
    // Extended keys arrive as a 0 or 0xE0 prefix followed by the scan code.
    static fn readKey() -> i32 {
      const i32 key = _getch();

      if (key == 0 || key == 0xE0)
        return _getch() + 0x100;

      return key;
    }
  };
} // namespace

namespace tdc::core::inventory {
  fn CreateInventoryProvider() -> UniquePointer<IInventoryProvider> {
    return std::make_unique<WindowsInventoryProvider>();
  }
} // namespace tdc::core::inventory

namespace tdc::core::host {
  fn CreateHost() -> UniquePointer<IHost> {
    return std::make_unique<WindowsHost>();
  }
} // namespace tdc::core::host

namespace tdc::core::console {
  fn CreateConsole() -> UniquePointer<IConsole> {
    return std::make_unique<WindowsConsole>();
  }
} // namespace tdc::core::console

#endif // _WIN32
