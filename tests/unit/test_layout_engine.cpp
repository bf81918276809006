#include "StyledText/render/GlyphLayoutEngine.hpp"

#include "test_helpers.hpp"

#include <doctest/doctest.h>

using namespace StyledText;
using namespace StyledTextTest;

namespace {

auto storage_for(std::shared_ptr<const StyledTextString> const& string) -> std::unique_ptr<TextStorage> {
  return std::make_unique<TextStorage>(string->render(ContentSizeCategory::Large), ContentSizeCategory::Large);
}

auto measure(std::string_view text, float width, int32_t maxLines = 0, float size = 14.0f) -> Size {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string(text, size));
  TextContainer container;
  container.maximumNumberOfLines = maxLines;
  return engine.measure(container, *storage, width, 2.0f);
}

} // namespace

TEST_SUITE_BEGIN("styledtext.layout_engine");

TEST_CASE("measure_single_line") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("Hello"));
  TextContainer container;
  Size size = engine.measure(container, *storage, UnboundedWidth, 2.0f);
  CHECK(size.width == doctest::Approx(60.0f));
  CHECK(size.height == doctest::Approx(14.0f));
  CHECK_MESSAGE(container.size == size, "container left at measured size");
}

TEST_CASE("measure_snaps_to_pixel_grid") {
  // Size 10: advance 60/7, so one character is 8.57 wide.
  Size size = measure("A", UnboundedWidth, 0, 10.0f);
  CHECK(size.width == doctest::Approx(9.0f));
  CHECK(size.height == doctest::Approx(10.0f));
}

TEST_CASE("wraps_at_spaces") {
  Size size = measure("Hello world", 70.0f);
  CHECK_MESSAGE(size.width == doctest::Approx(60.0f), "trailing space does not count");
  CHECK(size.height == doctest::Approx(28.0f));
}

TEST_CASE("breaks_long_words") {
  Size size = measure("ABCDEFGHIJ", 50.0f);
  CHECK(size.width == doctest::Approx(48.0f));
  CHECK(size.height == doctest::Approx(42.0f));
}

TEST_CASE("hard_breaks_at_newline") {
  Size size = measure("AB\nCD", UnboundedWidth);
  CHECK(size.width == doctest::Approx(24.0f));
  CHECK(size.height == doctest::Approx(28.0f));
}

TEST_CASE("line_limit_caps_height") {
  CHECK(measure("Hello world", 70.0f, 1).height == doctest::Approx(14.0f));
  CHECK(measure("Hello world", 70.0f, 0).height == doctest::Approx(28.0f));
}

TEST_CASE("tallest_span_sets_line_height") {
  auto string = StyledTextBuilder(bitmap_style(14.0f)).add("a").setSize(28.0f).add("b").build();
  GlyphLayoutEngine engine;
  auto storage = storage_for(string);
  TextContainer container;
  Size size = engine.measure(container, *storage, UnboundedWidth, 2.0f);
  CHECK(size.width == doctest::Approx(36.0f));
  CHECK(size.height == doctest::Approx(28.0f));
}

TEST_CASE("explicit_line_height_wins") {
  TextStyle style = bitmap_style(14.0f);
  style.typography.lineHeight = 20.0f;
  auto string = StyledTextBuilder(style).add("A\nB").build();
  GlyphLayoutEngine engine;
  auto storage = storage_for(string);
  TextContainer container;
  CHECK(engine.measure(container, *storage, UnboundedWidth, 2.0f).height == doctest::Approx(40.0f));
}

TEST_CASE("empty_text_has_no_size_or_bitmap") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string(""));
  TextContainer container;
  Size size = engine.measure(container, *storage, 100.0f, 2.0f);
  CHECK(size.empty());
  CHECK(!engine.rasterize(container, *storage, size, 2.0f, Color{255, 255, 255, 255}));
  CHECK(!engine.characterIndex(container, *storage, Point{0.0f, 0.0f}, 2.0f).found());
}

TEST_CASE("rasterize_fills_background_and_glyphs") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("H"));
  TextContainer container;
  Size size = engine.measure(container, *storage, UnboundedWidth, 2.0f);
  auto bitmap = engine.rasterize(container, *storage, size, 2.0f, Color{255, 255, 255, 255});
  REQUIRE(bitmap);
  CHECK(bitmap->width == 24u);
  CHECK(bitmap->height == 28u);
  CHECK(bitmap->strideBytes == 96u);
  CHECK(bitmap->scale == doctest::Approx(2.0f));
  CHECK(bitmap->byteSize() == 24u * 28u * 4u);
  CHECK_MESSAGE(bitmap->pixelAt(0, 0) == Color{0, 0, 0, 255}, "H stem is drawn");
  CHECK_MESSAGE(bitmap->pixelAt(9, 1) == Color{255, 255, 255, 255}, "gap between stems is background");
  CHECK_MESSAGE(bitmap->pixelAt(22, 27) == Color{255, 255, 255, 255}, "advance gap is background");
}

TEST_CASE("rasterize_without_background_is_transparent") {
  auto string = StyledTextBuilder(bitmap_style(14.0f, Color{255, 0, 0, 255})).add("H").build();
  GlyphLayoutEngine engine;
  auto storage = storage_for(string);
  TextContainer container;
  Size size = engine.measure(container, *storage, UnboundedWidth, 2.0f);
  auto bitmap = engine.rasterize(container, *storage, size, 2.0f, std::nullopt);
  REQUIRE(bitmap);
  CHECK(bitmap->pixelAt(0, 0) == Color{255, 0, 0, 255});
  CHECK(bitmap->pixelAt(9, 1).a == 0u);
}

TEST_CASE("character_index_reports_fraction") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("Hello"));
  TextContainer container;
  engine.measure(container, *storage, UnboundedWidth, 2.0f);

  CharacterHit middle = engine.characterIndex(container, *storage, Point{18.0f, 7.0f}, 2.0f);
  CHECK(middle.index == 1u);
  CHECK(middle.fraction == doctest::Approx(0.5f));

  CharacterHit start = engine.characterIndex(container, *storage, Point{-4.0f, 7.0f}, 2.0f);
  CHECK(start.index == 0u);
  CHECK(start.fraction == doctest::Approx(0.0f));

  CharacterHit past = engine.characterIndex(container, *storage, Point{60.0f, 7.0f}, 2.0f);
  CHECK(past.index == 4u);
  CHECK(past.fraction == doctest::Approx(1.0f));
}

TEST_CASE("character_index_picks_line") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("AB\nCD"));
  TextContainer container;
  engine.measure(container, *storage, UnboundedWidth, 2.0f);

  CharacterHit hit = engine.characterIndex(container, *storage, Point{15.0f, 20.0f}, 2.0f);
  CHECK(hit.index == 4u);
  CHECK(hit.fraction == doctest::Approx(0.25f));

  CharacterHit below = engine.characterIndex(container, *storage, Point{1.0f, 500.0f}, 2.0f);
  CHECK_MESSAGE(below.index == 3u, "points below the text use the last line");
}

TEST_CASE("unmeasured_container_lays_out_unbounded") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("Hello world"));
  TextContainer container;
  CharacterHit hit = engine.characterIndex(container, *storage, Point{78.0f, 7.0f}, 2.0f);
  CHECK(hit.index == 6u);
  CHECK(hit.fraction == doctest::Approx(0.5f));
}

TEST_CASE("repeated_layout_is_reused") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("Hello"));
  TextContainer container;
  engine.measure(container, *storage, 100.0f, 2.0f);
  engine.measure(container, *storage, 100.0f, 2.0f);
  CHECK(engine.layoutCount() == 1u);
  engine.measure(container, *storage, 30.0f, 2.0f);
  CHECK(engine.layoutCount() == 2u);
}

TEST_CASE("rasterize_reuses_measured_layout") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("Hello"));
  TextContainer container;
  Size size = engine.measure(container, *storage, 100.0f, 2.0f);
  CHECK(container.layoutWidth == doctest::Approx(100.0f));
  CHECK(engine.rasterize(container, *storage, size, 2.0f, std::nullopt));
  engine.characterIndex(container, *storage, Point{1.0f, 1.0f}, 2.0f);
  CHECK_MESSAGE(engine.layoutCount() == 1u, "no second line-breaking pass");
}

TEST_CASE("hit_test_keeps_measured_line_breaks") {
  // At size 10 "AA" is 17.14 wide and snaps to 18 at scale 1. The tiny "b"
  // (0.6 wide) does not fit at 17.2 but would at the snapped 18.
  auto string = StyledTextBuilder(bitmap_style(10.0f)).add("AA").setSize(0.7f).add("b").build();
  GlyphLayoutEngine engine;
  auto storage = storage_for(string);
  TextContainer container;
  Size size = engine.measure(container, *storage, 17.2f, 1.0f);
  CHECK(size.width == doctest::Approx(18.0f));
  CHECK(size.height == doctest::Approx(11.0f));

  CharacterHit hit = engine.characterIndex(container, *storage, Point{0.3f, 10.35f}, 1.0f);
  CHECK_MESSAGE(hit.index == 2u, "b stays on the second line");
  CHECK(hit.fraction == doctest::Approx(0.5f));
}

TEST_CASE("hit_test_uses_given_scale") {
  GlyphLayoutEngine engine;
  auto storage = storage_for(make_string("Hello"));
  TextContainer container;
  engine.characterIndex(container, *storage, Point{1.0f, 1.0f}, 2.0f);
  CHECK(engine.layoutCount() == 1u);
  engine.measure(container, *storage, UnboundedWidth, 2.0f);
  CHECK_MESSAGE(engine.layoutCount() == 1u, "measuring at the hit-test scale reuses its layout");
}

TEST_CASE("cache_identity_follows_registry") {
  FontRegistry first;
  FontRegistry second;
  GlyphLayoutEngine a(first);
  GlyphLayoutEngine b(first);
  GlyphLayoutEngine c(second);
  CHECK_MESSAGE(a.cacheIdentity() == b.cacheIdentity(), "same registry, same identity");
  CHECK_MESSAGE(a.cacheIdentity() != c.cacheIdentity(), "different registries never share");
}

TEST_SUITE_END();
