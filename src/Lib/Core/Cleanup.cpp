#include "TDC/Core/Cleanup.hpp"

#include <glaze/glaze.hpp>
#include <utility> // std::unreachable

#include "TDC/Core/Matcher.hpp"
#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Logging.hpp"
#include "TDC/Utils/Types.hpp"

#include "Utils/Files.hpp"

namespace tdc::core::cleanup {
  namespace {
    using utils::error::TdcError;
    using enum utils::error::TdcErrorCode;

    using utils::logging::Println;

    using utils::types::Err;
    using utils::types::String;

    using console::PromptResult;
    using host::RemovalOutcome;
    using inventory::Device;
    using inventory::Driver;
    using inventory::DriverPackage;
    using inventory::InventoryObject;
    using rules::Category;
    using rules::DriverPackageRule;
    using rules::UninstallRule;

    template <typename T>
    fn Widen(Result<Vec<T>> typed) -> Result<Vec<InventoryObject>> {
      if (!typed)
        return Err(typed.error());

      Vec<InventoryObject> objects;
      objects.reserve(typed->size());

      for (T& object : *typed)
        objects.emplace_back(std::move(object));

      return objects;
    }

    template <typename T>
    fn WriteDump(const Vec<InventoryObject>& objects, String& buffer) -> Result<> {
      Vec<T> typed;
      typed.reserve(objects.size());

      for (const InventoryObject& object : objects)
        typed.push_back(std::get<T>(object));

      if (const glz::error_ctx errc = glz::write<glz::opts { .prettify = true }>(typed, buffer); errc)
        ERR_FMT(InternalError, "Failed to serialize dump: {}", glz::format_error(errc, buffer));

      return {};
    }
  } // namespace

  fn GetModuleInfo(const Category category) -> const ModuleInfo& {
    for (const ModuleInfo& module : MODULES)
      if (module.category == category)
        return module;

    std::unreachable();
  }

  CleanupOrchestrator::CleanupOrchestrator(
    inventory::IInventoryProvider&           inventory,
    host::IHost&                             host,
    console::IConsole&                       console,
    rules::IRuleSetProvider&                 rules,
    services::uninstaller::UninstallTracker& tracker
  )
    : m_inventory(inventory), m_host(host), m_console(console), m_rules(rules), m_tracker(tracker) {}

  fn CleanupOrchestrator::run(const Category category, const RunState& state) -> Result<ModuleRunInfo> {
    const ModuleInfo& module = GetModuleInfo(category);

    Result<rules::RuleSet> ruleSet = m_rules.resolve(category);

    if (!ruleSet)
      return Err(ruleSet.error());

    Result<Vec<InventoryObject>> objects = collect(category);

    if (!objects)
      return Err(objects.error());

    debug_log("{}: {} rules, {} {}", module.name, ruleSet->size(), objects->size(), module.noun);

    ModuleRunInfo info;

    for (const InventoryObject& object : *objects) {
      Result<Option<UninstallRule>> match = matcher::FindMatch(*ruleSet, object, m_cache);

      if (!match)
        return Err(match.error());

      if (!*match)
        continue;

      ++info.matched;

      const String& label = rules::GetLabel(**match);

      if (state.interactive && !state.dryRun) {
        const PromptResult answer = m_console.confirm(std::format("Uninstall '{}'?", label));

        if (answer == PromptResult::No) {
          Println("Skipping '{}'...", label);
          continue;
        }

        if (answer == PromptResult::Cancel)
          ERR(Cancelled, "Cleanup cancelled by user");
      }

      Println("Uninstalling '{}'...", label);

      if (state.dryRun)
        continue;

      Result<RemovalOutcome> outcome = remove(object, **match, state.interactive);

      if (!outcome) {
        if (outcome.error().code == AlreadyRemoved) {
          Println("  '{}' is already uninstalled by a previous uninstaller.", label);
          debug_at(outcome.error());
          continue;
        }

        error_log("Failed to uninstall '{}'", label);
        return Err(outcome.error());
      }

      ++info.removed;

      if (outcome->rebootRequired) {
        debug_log("'{}' requires a reboot", label);
        info.rebootRequired = true;
      }
    }

    if (info.matched == 0)
      Println("No {} to uninstall is found.", module.noun);

    return info;
  }

  fn CleanupOrchestrator::dump(const Category category, const RunState& state) -> Result<usize> {
    const ModuleInfo& module = GetModuleInfo(category);

    Result<Vec<InventoryObject>> objects = collect(category);

    if (!objects)
      return Err(objects.error());

    Vec<InventoryObject> interesting;

    for (InventoryObject& object : *objects) {
      Result<bool> keep = m_interest.isOfInterest(object);

      if (!keep)
        return Err(keep.error());

      if (*keep)
        interesting.push_back(std::move(object));
    }

    String buffer;

    if (!interesting.empty()) {
      Result<> serialized = [&] -> Result<> {
        switch (category) {
          case Category::Device:
            return WriteDump<Device>(interesting, buffer);
          case Category::Driver:
            return WriteDump<Driver>(interesting, buffer);
          case Category::DriverPackage:
            return WriteDump<DriverPackage>(interesting, buffer);
        }

        ERR(InternalError, "Unknown rule category");
      }();

      if (!serialized)
        return Err(serialized.error());
    }

    if (Result<> written = utils::files::WriteTextFile(state.currentPath / "dumps" / module.dumpFile, buffer); !written)
      return Err(written.error());

    if (interesting.empty())
      Println("No {} to dump", module.noun);
    else
      Println("Dumped {} {} into '{}'", interesting.size(), module.noun, module.dumpFile);

    return interesting.size();
  }

  fn CleanupOrchestrator::collect(const Category category) -> Result<Vec<InventoryObject>> {
    switch (category) {
      case Category::Device:
        return Widen(m_inventory.enumerateDevices());
      case Category::Driver:
        return Widen(m_inventory.enumerateDrivers());
      case Category::DriverPackage:
        return Widen(m_inventory.enumerateDriverPackages());
    }

    ERR(InternalError, "Unknown rule category");
  }

  fn CleanupOrchestrator::remove(const InventoryObject& object, const UninstallRule& rule, const bool interactive) -> Result<RemovalOutcome> {
    if (const auto* device = std::get_if<Device>(&object))
      return m_host.removeDevice(*device);

    if (const auto* driver = std::get_if<Driver>(&object))
      return m_host.removeDriver(*driver);

    const auto* package     = std::get_if<DriverPackage>(&object);
    const auto* packageRule = std::get_if<DriverPackageRule>(&rule);

    if (!package || !packageRule)
      ERR(InternalError, "Driver package matched by a rule of another kind");

    if (Result<> removed = m_tracker.uninstall(*package, packageRule->uninstallMethod, interactive); !removed)
      return Err(removed.error());

    return RemovalOutcome { .rebootRequired = false };
  }
} // namespace tdc::core::cleanup
