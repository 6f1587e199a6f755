#include "TDC/Services/Interest.hpp"

#include "TDC/Utils/Error.hpp"
#include "TDC/Utils/Types.hpp"

namespace tdc::services::interest {
  namespace {
    using utils::types::Err;
    using utils::types::None;
    using utils::types::String;
    using utils::types::Vec;

    using core::inventory::Device;
    using core::inventory::Driver;
    using core::inventory::DriverPackage;

    fn View(const Option<String>& value) -> Option<StringView> {
      if (value)
        return StringView(*value);

      return None;
    }
  } // namespace

  fn InterestScreen::isOfInterest(const Option<StringView> text) -> Result<bool> {
    if (!text)
      return false;

    for (const StringView pattern : INTEREST_PATTERNS) {
      Result<bool> matched = m_cache.isMatch(String(pattern), *text);

      if (!matched)
        return Err(matched.error());

      if (!*matched)
        continue;

      for (const StringView counter : COUNTER_INTEREST_PATTERNS) {
        Result<bool> rejected = m_cache.isMatch(String(counter), *text);

        if (!rejected)
          return Err(rejected.error());

        if (*rejected)
          return false;
      }

      return true;
    }

    return false;
  }

  fn InterestScreen::isCandidate(const Span<const Option<StringView>> candidates) -> Result<bool> {
    for (const Option<StringView>& candidate : candidates) {
      Result<bool> interesting = isOfInterest(candidate);

      if (!interesting || *interesting)
        return interesting;
    }

    return false;
  }

  fn InterestScreen::isOfInterest(const core::inventory::InventoryObject& object) -> Result<bool> {
    Vec<Option<StringView>> candidates;

    if (const auto* device = std::get_if<Device>(&object)) {
      candidates = { View(device->description), View(device->manufacturer), View(device->infOriginalName) };

      for (const String& hardwareId : device->hardwareIds)
        candidates.emplace_back(hardwareId);
    } else if (const auto* driver = std::get_if<Driver>(&object)) {
      candidates = { View(driver->infOriginalName), View(driver->provider) };
    } else if (const auto* package = std::get_if<DriverPackage>(&object)) {
      if (!package->displayName || !package->uninstallString)
        return false;

      candidates = { View(package->displayName), View(package->publisher), View(package->uninstallString) };
    }

    return isCandidate(candidates);
  }
} // namespace tdc::services::interest
