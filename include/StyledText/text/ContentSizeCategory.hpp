#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace StyledText {

// Accessibility text-scale setting. Large is the platform default and maps
// to a multiplier of 1.0.
enum class ContentSizeCategory : uint8_t {
  ExtraSmall = 0,
  Small,
  Medium,
  Large,
  ExtraLarge,
  ExtraExtraLarge,
  ExtraExtraExtraLarge,
  AccessibilityMedium,
  AccessibilityLarge,
  AccessibilityExtraLarge,
  AccessibilityExtraExtraLarge,
  AccessibilityExtraExtraExtraLarge,
};

constexpr size_t ContentSizeCategoryCount =
    static_cast<size_t>(ContentSizeCategory::AccessibilityExtraExtraExtraLarge) + 1u;

auto ContentSizeMultiplier(ContentSizeCategory category) -> float;
auto IsAccessibilityCategory(ContentSizeCategory category) -> bool;

auto ToString(ContentSizeCategory category) -> std::string_view;
auto ContentSizeCategoryFromName(std::string_view name, ContentSizeCategory& out) -> bool;

} // namespace StyledText
