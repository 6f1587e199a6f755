/**
 * @file Rules.hpp
 * @brief Declarative uninstall rules and the rule categories they belong to.
 *
 * A rule file is a JSON array of rule records of a single kind. Each pattern
 * field is optional; an absent pattern matches anything.
 */

#pragma once

#include <glaze/glaze.hpp>
#include <variant> // std::variant

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace tdc::core::rules {
  namespace {
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::Vec;
  } // namespace

  /**
   * @enum Category
   * @brief The three kinds of inventory objects a rule set can target.
   */
  enum class Category : u8 {
    Device,
    Driver,
    DriverPackage,
  };

  /**
   * @enum UninstallMethod
   * @brief How a matched driver package is removed.
   */
  enum class UninstallMethod : u8 {
    Normal,       ///< Launch the uninstaller and wait for it and every descendant process.
    Deferred,     ///< Launch the uninstaller, then wait for the real uninstaller it hands off to.
    RegistryOnly, ///< Only delete the stale Uninstall registry entry.
  };

  struct DeviceRule {
    String         friendlyName;      ///< Label shown to the user.
    Option<String> deviceDescription; ///< Pattern over Device::description.
    Option<String> manufacturerName;  ///< Pattern over Device::manufacturer.
    Option<String> hardwareId;        ///< Pattern over any of Device::hardwareIds.
    Option<String> classGuid;         ///< Exact setup class constraint.
  };

  struct DriverRule {
    String         friendlyName; ///< Label shown to the user.
    Option<String> originalName; ///< Pattern over Driver::infOriginalName.
    Option<String> providerName; ///< Pattern over Driver::provider.
    Option<String> classGuid;    ///< Exact setup class constraint.
  };

  struct DriverPackageRule {
    String          friendlyName;   ///< Label shown to the user.
    Option<String>  displayName;    ///< Pattern over DriverPackage::displayName.
    Option<String>  displayVersion; ///< Pattern over DriverPackage::displayVersion.
    Option<String>  publisher;      ///< Pattern over DriverPackage::publisher.
    UninstallMethod uninstallMethod = UninstallMethod::Normal;
  };

  /**
   * @brief Any uninstall rule. Mirrors inventory::InventoryObject.
   */
  using UninstallRule = std::variant<DeviceRule, DriverRule, DriverPackageRule>;

  /**
   * @brief Ordered rules of one category. Matching is first-match-wins.
   */
  using RuleSet = Vec<UninstallRule>;

  /**
   * @brief Returns the label of any rule.
   */
  fn GetLabel(const UninstallRule& rule) -> const String&;

  /**
   * @brief Returns the rule file name for a category, e.g. "device_identifiers.json".
   */
  fn GetRuleFileName(Category category) -> StringView;

  /**
   * @brief Parses the contents of a rule file.
   * @param category Which kind of rules the text holds.
   * @param json The rule file contents.
   * @return The rules in file order, or a ConfigurationError describing the parse failure.
   */
  fn ParseRuleSet(Category category, StringView json) -> Result<RuleSet>;

  /**
   * @class IRuleSetProvider
   * @brief Produces the rule set for a category.
   */
  class IRuleSetProvider {
   public:
    IRuleSetProvider(const IRuleSetProvider&) = delete;
    IRuleSetProvider(IRuleSetProvider&&)      = delete;

    fn operator=(const IRuleSetProvider&)->IRuleSetProvider& = delete;
    fn operator=(IRuleSetProvider&&)->IRuleSetProvider&      = delete;

    virtual ~IRuleSetProvider() = default;

    [[nodiscard]] virtual fn resolve(Category category) -> Result<RuleSet> = 0;

   protected:
    IRuleSetProvider() = default;
  };
} // namespace tdc::core::rules

namespace glz {
  template <>
  struct meta<tdc::core::rules::UninstallMethod> {
    using enum tdc::core::rules::UninstallMethod;

    static constexpr auto value = enumerate("normal", Normal, "deferred", Deferred, "registry_only", RegistryOnly);
  };

  template <>
  struct meta<tdc::core::rules::DeviceRule> {
    using T = tdc::core::rules::DeviceRule;

    // clang-format off
    static constexpr detail::Object value = object(
      "friendlyName",      &T::friendlyName,
      "deviceDescription", &T::deviceDescription,
      "manufacturerName",  &T::manufacturerName,
      "hardwareId",        &T::hardwareId,
      "classGuid",         &T::classGuid
    );
    // clang-format on
  };

  template <>
  struct meta<tdc::core::rules::DriverRule> {
    using T = tdc::core::rules::DriverRule;

    // clang-format off
    static constexpr detail::Object value = object(
      "friendlyName", &T::friendlyName,
      "originalName", &T::originalName,
      "providerName", &T::providerName,
      "classGuid",    &T::classGuid
    );
    // clang-format on
  };

  template <>
  struct meta<tdc::core::rules::DriverPackageRule> {
    using T = tdc::core::rules::DriverPackageRule;

    // clang-format off
    static constexpr detail::Object value = object(
      "friendlyName",    &T::friendlyName,
      "displayName",     &T::displayName,
      "displayVersion",  &T::displayVersion,
      "publisher",       &T::publisher,
      "uninstallMethod", &T::uninstallMethod
    );
    // clang-format on
  };
} // namespace glz
