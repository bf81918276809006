#include "StyledText/text/ContentSizeCategory.hpp"

#include <doctest/doctest.h>

#include <string_view>

using namespace StyledText;

TEST_SUITE_BEGIN("styledtext.content_size_category");

TEST_CASE("large_is_identity") {
  CHECK(ContentSizeMultiplier(ContentSizeCategory::Large) == doctest::Approx(1.0f));
}

TEST_CASE("multipliers_increase") {
  float previous = 0.0f;
  for (size_t i = 0; i < ContentSizeCategoryCount; ++i) {
    float m = ContentSizeMultiplier(static_cast<ContentSizeCategory>(i));
    CHECK_MESSAGE(m > previous, "ramp is strictly increasing");
    previous = m;
  }
  CHECK(ContentSizeMultiplier(ContentSizeCategory::ExtraLarge) == doctest::Approx(19.0f / 17.0f));
}

TEST_CASE("accessibility_flags") {
  CHECK(!IsAccessibilityCategory(ContentSizeCategory::ExtraExtraExtraLarge));
  CHECK(IsAccessibilityCategory(ContentSizeCategory::AccessibilityMedium));
  CHECK(IsAccessibilityCategory(ContentSizeCategory::AccessibilityExtraExtraExtraLarge));
}

TEST_CASE("names_round_trip") {
  for (size_t i = 0; i < ContentSizeCategoryCount; ++i) {
    auto category = static_cast<ContentSizeCategory>(i);
    ContentSizeCategory parsed = ContentSizeCategory::Large;
    CHECK(ContentSizeCategoryFromName(ToString(category), parsed));
    CHECK(parsed == category);
  }
  CHECK(ToString(ContentSizeCategory::Large) == std::string_view("large"));
}

TEST_CASE("unknown_name_leaves_output") {
  ContentSizeCategory out = ContentSizeCategory::Small;
  CHECK(!ContentSizeCategoryFromName("huge", out));
  CHECK(out == ContentSizeCategory::Small);
}

TEST_SUITE_END();
