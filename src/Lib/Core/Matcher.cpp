#include "TDC/Core/Matcher.hpp"

#include <cctype>    // std::tolower

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Types.hpp"

namespace tdc::core::matcher {
  namespace {
    using utils::cache::RuleCache;
    using utils::types::Err;
    using utils::types::None;
    using utils::types::Vec;

    using inventory::Device;
    using inventory::Driver;
    using inventory::DriverPackage;
    using inventory::InventoryObject;

    using rules::DeviceRule;
    using rules::DriverPackageRule;
    using rules::DriverRule;
    using rules::UninstallRule;

    fn PatternMatches(const Option<String>& pattern, const Option<String>& value, RuleCache& cache) -> Result<bool> {
      if (!pattern)
        return true;

      return cache.isMatch(*pattern, value ? StringView(*value) : StringView());
    }

    fn PatternMatchesAny(const Option<String>& pattern, const Vec<String>& values, RuleCache& cache) -> Result<bool> {
      if (!pattern)
        return true;

      if (values.empty())
        return cache.isMatch(*pattern, StringView());

      for (const String& value : values) {
        Result<bool> matched = cache.isMatch(*pattern, value);

        if (!matched || *matched)
          return matched;
      }

      return false;
    }

    fn ClassGuidMatches(const Option<String>& constraint, const StringView classGuid) -> bool {
      return !constraint || NormalizeClassGuid(*constraint) == NormalizeClassGuid(classGuid);
    }

    // Fields are evaluated in order and the first failing field short-circuits.
#define TDC_CHECK_FIELD(expr)              \
  if (Result<bool> res = (expr); !res)     \
    return res;                            \
  else if (!*res)                          \
    return false;

    fn MatchDevice(const DeviceRule& rule, const Device& device, RuleCache& cache) -> Result<bool> {
      if (!ClassGuidMatches(rule.classGuid, device.classGuid))
        return false;

      TDC_CHECK_FIELD(PatternMatches(rule.deviceDescription, device.description, cache));
      TDC_CHECK_FIELD(PatternMatches(rule.manufacturerName, device.manufacturer, cache));
      TDC_CHECK_FIELD(PatternMatchesAny(rule.hardwareId, device.hardwareIds, cache));

      return true;
    }

    fn MatchDriver(const DriverRule& rule, const Driver& driver, RuleCache& cache) -> Result<bool> {
      if (!ClassGuidMatches(rule.classGuid, driver.classGuid))
        return false;

      TDC_CHECK_FIELD(PatternMatches(rule.originalName, driver.infOriginalName, cache));
      TDC_CHECK_FIELD(PatternMatches(rule.providerName, driver.provider, cache));

      return true;
    }

    fn MatchDriverPackage(const DriverPackageRule& rule, const DriverPackage& package, RuleCache& cache) -> Result<bool> {
      TDC_CHECK_FIELD(PatternMatches(rule.displayName, package.displayName, cache));
      TDC_CHECK_FIELD(PatternMatches(rule.displayVersion, package.displayVersion, cache));
      TDC_CHECK_FIELD(PatternMatches(rule.publisher, package.publisher, cache));

      return true;
    }

#undef TDC_CHECK_FIELD

    template <typename... Ts>
    struct Overloaded : Ts... {
      using Ts::operator()...;
    };
  } // namespace

  fn NormalizeClassGuid(const StringView guid) -> String {
    String normalized;
    normalized.reserve(guid.size());

    for (const char chr : guid)
      if (chr != '{' && chr != '}')
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(chr))));

    return normalized;
  }

  fn Matches(const UninstallRule& rule, const InventoryObject& object, RuleCache& cache) -> Result<bool> {
    return std::visit(
      Overloaded {
        [&](const DeviceRule& typed, const Device& device) -> Result<bool> { return MatchDevice(typed, device, cache); },
        [&](const DriverRule& typed, const Driver& driver) -> Result<bool> { return MatchDriver(typed, driver, cache); },
        [&](const DriverPackageRule& typed, const DriverPackage& package) -> Result<bool> { return MatchDriverPackage(typed, package, cache); },
        [](const auto&, const auto&) -> Result<bool> { return false; },
      },
      rule,
      object
    );
  }

  fn FindMatch(const rules::RuleSet& ruleSet, const InventoryObject& object, RuleCache& cache) -> Result<Option<UninstallRule>> {
    for (const UninstallRule& rule : ruleSet) {
      Result<bool> matched = Matches(rule, object, cache);

      if (!matched)
        return Err(matched.error());

      if (*matched)
        return rule;
    }

    return None;
  }
} // namespace tdc::core::matcher
