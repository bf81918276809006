#include "StyledText/text/ContentSizeCategory.hpp"

#include <array>

namespace StyledText {

namespace {

// Body text point sizes of the dynamic type ramp, relative to the 17pt
// default at Large.
constexpr float BodyPointSize = 17.0f;
constexpr std::array<float, ContentSizeCategoryCount> BodySizes = {
    14.0f, 15.0f, 16.0f, 17.0f, 19.0f, 21.0f, 23.0f,
    28.0f, 33.0f, 40.0f, 47.0f, 53.0f,
};

constexpr std::array<std::string_view, ContentSizeCategoryCount> Names = {
    "extra_small",
    "small",
    "medium",
    "large",
    "extra_large",
    "extra_extra_large",
    "extra_extra_extra_large",
    "accessibility_medium",
    "accessibility_large",
    "accessibility_extra_large",
    "accessibility_extra_extra_large",
    "accessibility_extra_extra_extra_large",
};

} // namespace

auto ContentSizeMultiplier(ContentSizeCategory category) -> float {
  size_t idx = static_cast<size_t>(category);
  if (idx >= BodySizes.size()) return 1.0f;
  return BodySizes[idx] / BodyPointSize;
}

auto IsAccessibilityCategory(ContentSizeCategory category) -> bool {
  return static_cast<size_t>(category) >= static_cast<size_t>(ContentSizeCategory::AccessibilityMedium) &&
         static_cast<size_t>(category) < ContentSizeCategoryCount;
}

auto ToString(ContentSizeCategory category) -> std::string_view {
  size_t idx = static_cast<size_t>(category);
  if (idx >= Names.size()) return "large";
  return Names[idx];
}

auto ContentSizeCategoryFromName(std::string_view name, ContentSizeCategory& out) -> bool {
  for (size_t i = 0; i < Names.size(); ++i) {
    if (Names[i] == name) {
      out = static_cast<ContentSizeCategory>(i);
      return true;
    }
  }
  return false;
}

} // namespace StyledText
