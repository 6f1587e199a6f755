#include "TDC/Core/Rules.hpp"

#include <glaze/glaze.hpp>
#include <matchit.hpp>

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Logging.hpp"
#include "TDC/Utils/Types.hpp"

namespace tdc::core::rules {
  namespace {
    using utils::error::TdcError;
    using enum utils::error::TdcErrorCode;

    using utils::types::Err;

    template <typename RuleType>
    fn ReadRules(const String& buffer, const Category category) -> Result<RuleSet> {
      using glz::error_ctx, glz::read, glz::error_code;

      Vec<RuleType> parsed;

      if (error_ctx errc = read<glz::opts { .error_on_unknown_keys = true }>(parsed, buffer); errc.ec != error_code::none)
        return Err(TdcError(
          ConfigurationError,
          std::format("Failed to parse '{}': {}", GetRuleFileName(category), glz::format_error(errc, buffer))
        ));

      RuleSet rules;
      rules.reserve(parsed.size());

      for (RuleType& rule : parsed)
        rules.emplace_back(std::move(rule));

      return rules;
    }
  } // namespace

  fn GetLabel(const UninstallRule& rule) -> const String& {
    return std::visit([](const auto& typed) -> const String& { return typed.friendlyName; }, rule);
  }

  fn GetRuleFileName(const Category category) -> StringView {
    using matchit::match, matchit::is, matchit::_;
    using enum Category;

    return match(category)(
      is | Device        = StringView("device_identifiers.json"),
      is | Driver        = StringView("driver_identifiers.json"),
      is | DriverPackage = StringView("driver_package_identifiers.json"),
      is | _             = StringView("")
    );
  }

  fn ParseRuleSet(const Category category, const StringView json) -> Result<RuleSet> {
    const String buffer(json);

    Result<RuleSet> rules = [&] -> Result<RuleSet> {
      switch (category) {
        case Category::Device:
          return ReadRules<DeviceRule>(buffer, category);
        case Category::Driver:
          return ReadRules<DriverRule>(buffer, category);
        case Category::DriverPackage:
          return ReadRules<DriverPackageRule>(buffer, category);
      }

      ERR(InternalError, "Unknown rule category");
    }();

    if (rules)
      debug_log("Parsed {} rules from '{}'", rules->size(), GetRuleFileName(category));

    return rules;
  }
} // namespace tdc::core::rules
