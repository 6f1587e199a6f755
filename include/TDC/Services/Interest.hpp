/**
 * @file Interest.hpp
 * @brief Coarse vendor-name screen used to select inventory objects for dumps.
 */

#pragma once

#include "../Core/Inventory.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/RuleCache.hpp"
#include "../Utils/Types.hpp"

namespace tdc::services::interest {
  namespace {
    using utils::types::Array;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::Span;
    using utils::types::StringView;
  } // namespace

  // clang-format off
  inline constexpr Array<StringView, 26> INTEREST_PATTERNS = {
    "10moon",    "Acepen",    "Artisul",       "Digitizer", "EMR",       "filtr",
    "Gaomon",    "Genius",    "Huion",         "Kenting",   "libwdi",    "Lifetec",
    "Monoprice", "Parblo",    "RobotPen",      "Tablet",    "UC[-| ]?Logic",
    "UGEE",      "Veikk",     "ViewSonic",     R"(v\w*hid)", "Wacom",    "WinUSB",
    "XenceLabs", "XENX",      "XP[-| ]?Pen",
  };

  inline constexpr Array<StringView, 2> COUNTER_INTEREST_PATTERNS = { "android", "logitech" };
  // clang-format on

  /**
   * @class InterestScreen
   * @brief Decides whether strings and inventory objects look tablet related.
   *
   * A string is of interest when it matches any interest pattern and no
   * counter-interest pattern.
   */
  class InterestScreen {
   public:
    [[nodiscard]] fn isOfInterest(Option<StringView> text) -> Result<bool>;

    /**
     * @brief Whether any of @p candidates is of interest.
     */
    [[nodiscard]] fn isCandidate(Span<const Option<StringView>> candidates) -> Result<bool>;

    /**
     * @brief Applies the per-kind candidate selection to an inventory object.
     *
     * Driver packages are only considered when both their display name and
     * uninstall string are set.
     */
    [[nodiscard]] fn isOfInterest(const core::inventory::InventoryObject& object) -> Result<bool>;

   private:
    utils::cache::RuleCache m_cache;
  };
} // namespace tdc::services::interest
