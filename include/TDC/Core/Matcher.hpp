/**
 * @file Matcher.hpp
 * @brief Evaluates uninstall rules against inventory objects.
 */

#pragma once

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/RuleCache.hpp"
#include "../Utils/Types.hpp"
#include "Inventory.hpp"
#include "Rules.hpp"

namespace tdc::core::matcher {
  namespace {
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  /**
   * @brief Normalizes a setup class GUID for comparison (lowercase, no braces).
   */
  fn NormalizeClassGuid(StringView guid) -> String;

  /**
   * @brief Tests whether a single rule matches an inventory object.
   * @param rule The rule to evaluate.
   * @param object The inventory object.
   * @param cache Compiled pattern cache.
   * @return false when the rule and object are of different kinds, or a
   *         ParseError if one of the rule's patterns is malformed.
   *
   * Every present pattern must match its attribute; an absent attribute is
   * matched as the empty string. Multi-valued attributes match when any value
   * does. A class GUID constraint is an exact comparison.
   */
  fn Matches(const rules::UninstallRule& rule, const inventory::InventoryObject& object, utils::cache::RuleCache& cache) -> Result<bool>;

  /**
   * @brief Returns the first rule of @p ruleSet that matches @p object.
   * @return The matching rule, None when no rule matches, or the first pattern error hit.
   */
  fn FindMatch(const rules::RuleSet& ruleSet, const inventory::InventoryObject& object, utils::cache::RuleCache& cache) -> Result<Option<rules::UninstallRule>>;
} // namespace tdc::core::matcher
