#pragma once

#include <regex> // std::{regex, regex_error, regex_search}

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace tdc::utils::cache {
  namespace {
    using types::Err;
    using types::Result;
    using types::SharedPointer;
    using types::String;
    using types::StringView;
    using types::UnorderedMap;
    using types::usize;

    using error::TdcError;
    using enum error::TdcErrorCode;
  } // namespace

  /**
   * @brief A compiled, case-insensitive match pattern.
   */
  using Pattern = std::regex;

  /**
   * @class RuleCache
   * @brief Memoizes compiled match patterns by their source text.
   *
   * Every rule field is a pattern, and the same handful of patterns is
   * evaluated against every inventory object, so each distinct text is
   * compiled exactly once. Patterns are compiled case-insensitively and
   * matched with search semantics (a match anywhere in the subject counts).
   *
   * Only the foreground cleanup sequence touches the cache, so it carries no lock.
   */
  class RuleCache {
   public:
    RuleCache() = default;

    /**
     * @brief Returns the compiled pattern for @p patternText, compiling it on first use.
     * @param patternText The pattern source text.
     * @return The shared compiled pattern, or a ParseError if the text is malformed.
     *
     * A failed compilation is not remembered, so asking again reports the same error again.
     */
    fn get(const String& patternText) -> Result<SharedPointer<const Pattern>> {
      if (const auto iter = m_patterns.find(patternText); iter != m_patterns.end())
        return iter->second;

      try {
        SharedPointer<const Pattern> compiled = std::make_shared<Pattern>(patternText, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);

        debug_log("Compiled match pattern '{}'", patternText);

        m_patterns.emplace(patternText, compiled);

        return compiled;
      } catch (const std::regex_error& err) {
        return Err(TdcError(ParseError, std::format("Invalid match pattern '{}': {}", patternText, err.what())));
      }
    }

    /**
     * @brief Tests whether @p subject contains a match for @p patternText.
     * @param patternText The pattern source text.
     * @param subject The string to search.
     * @return Whether the pattern matched, or the compilation error.
     */
    fn isMatch(const String& patternText, const StringView subject) -> Result<bool> {
      Result<SharedPointer<const Pattern>> pattern = get(patternText);

      if (!pattern)
        return Err(pattern.error());

      return std::regex_search(subject.begin(), subject.end(), **pattern);
    }

    [[nodiscard]] fn size() const -> usize {
      return m_patterns.size();
    }

   private:
    UnorderedMap<String, SharedPointer<const Pattern>> m_patterns;
  };
} // namespace tdc::utils::cache
