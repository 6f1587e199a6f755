/**
 * @file Console.hpp
 * @brief Interactive keyboard input.
 */

#pragma once

#include <stop_token> // std::stop_token

#include "../Utils/Definitions.hpp"
#include "../Utils/Types.hpp"

namespace tdc::core::console {
  namespace {
    using utils::types::Option;
    using utils::types::StringView;
    using utils::types::u8;
  } // namespace

  enum class PromptResult : u8 {
    Yes,
    No,
    Cancel,
  };

  /**
   * @class IConsole
   * @brief Single-keypress questions and waits.
   */
  class IConsole {
   public:
    IConsole(const IConsole&) = delete;
    IConsole(IConsole&&)      = delete;

    fn operator=(const IConsole&)->IConsole& = delete;
    fn operator=(IConsole&&)->IConsole&      = delete;

    virtual ~IConsole() = default;

    /**
     * @brief Asks a yes/no/cancel question.
     *
     * 'y' or Enter answers Yes, 'q' or Escape cancels, any other key answers No.
     */
    virtual fn confirm(StringView question) -> PromptResult = 0;

    /**
     * @brief Waits for a single keypress.
     * @return The key, or None if a stop was requested first.
     */
    virtual fn waitForKey(std::stop_token stopToken) -> Option<char> = 0;

   protected:
    IConsole() = default;
  };

  /**
   * @brief Creates the terminal console for the current platform.
   */
  fn CreateConsole() -> utils::types::UniquePointer<IConsole>;
} // namespace tdc::core::console
