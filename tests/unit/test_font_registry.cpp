#include "StyledText/text/FontRegistry.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <vector>

using namespace StyledText;

namespace {

auto system_font_dirs() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> dirs;
  dirs.emplace_back("/usr/share/fonts");
  dirs.emplace_back("/usr/local/share/fonts");
  if (auto* home = std::getenv("HOME")) {
    dirs.emplace_back(std::filesystem::path(home) / ".local/share/fonts");
    dirs.emplace_back(std::filesystem::path(home) / ".fonts");
  }
  return dirs;
}

auto find_system_font_file() -> std::optional<std::filesystem::path> {
  for (auto const& dir : system_font_dirs()) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) continue;
    for (auto const& entry : std::filesystem::recursive_directory_iterator(dir, ec)) {
      if (ec) break;
      if (!entry.is_regular_file()) continue;
      auto ext = entry.path().extension().string();
      if (ext == ".ttf" || ext == ".otf") return entry.path();
    }
  }
  return std::nullopt;
}

} // namespace

TEST_SUITE_BEGIN("styledtext.font_registry");

TEST_CASE("to_string_helpers") {
  CHECK(ToString(FontSlant::Upright) == std::string_view("upright"));
  CHECK(ToString(FontSlant::Italic) == std::string_view("italic"));
  CHECK(ToString(FontSlant::Oblique) == std::string_view("oblique"));
  CHECK_MESSAGE(ToString(static_cast<FontSlant>(255)) == std::string_view("upright"), "slant fallback string");
  CHECK(ToString(FontFallbackPolicy::BundleOnly) == std::string_view("bundle_only"));
  CHECK(ToString(FontFallbackPolicy::BundleThenOS) == std::string_view("bundle_then_os"));
}

TEST_CASE("bitmap_family_returns_null") {
  Typography typography;
  typography.size = 14.0f;
  typography.family = std::string(BitmapFontFamily);
  FontRegistry registry;
  CHECK_MESSAGE(!registry.layoutText("Hello", typography, 1.0f, false), "bitmap family skips face lookup");
}

TEST_CASE("empty_text_returns_run") {
  FontRegistry registry;
  Typography typography;
  auto run = registry.layoutText("", typography, 2.0f, false);
  REQUIRE(run);
  CHECK(run->glyphs.empty());
  CHECK(run->layoutScale == doctest::Approx(2.0f));
}

TEST_CASE("bundle_only_without_faces_returns_null") {
  FontRegistry registry;
  Typography typography;
  typography.fallback = FontFallbackPolicy::BundleOnly;
  CHECK(!registry.layoutText("Hi", typography, 1.0f, false));
  CHECK(!registry.hasBundledFaces());
}

#if STYLEDTEXT_ENABLE_FONTS
TEST_CASE("font_dirs_bump_generation") {
  FontRegistry registry;
  uint64_t initial = registry.generation();
  registry.addBundleDir("/nonexistent/styledtext-bundle");
  uint64_t afterBundle = registry.generation();
  CHECK_MESSAGE(afterBundle != initial, "bundle dir changes the generation");
  registry.addOsFallbackDir("/nonexistent/styledtext-os");
  CHECK_MESSAGE(registry.generation() != afterBundle, "fallback dir changes the generation");
  uint64_t settled = registry.generation();
  registry.addBundleDir("");
  CHECK_MESSAGE(registry.generation() == settled, "empty dir is ignored");
}

TEST_CASE("bundle_dir_loads_faces") {
  auto fontPath = find_system_font_file();
  if (!fontPath) return;

  FontRegistry registry;
  registry.addBundleDir(fontPath->parent_path().string());
  registry.loadBundledFonts();
  CHECK(registry.hasBundledFaces());

  Typography typography;
  typography.size = 12.0f;
  typography.fallback = FontFallbackPolicy::BundleOnly;
  auto run = registry.layoutText("Hi", typography, 2.0f, true);
  REQUIRE(run);
  CHECK(run->glyphs.size() >= 2u);
  CHECK(run->height > 0.0f);
  CHECK_MESSAGE(run->glyphs[1].cluster == 1u, "clusters are byte offsets");
  CHECK(run->glyphs[0].advance > 0.0f);
}

TEST_CASE("os_fallback_layout") {
  std::string chosen;
  for (auto const& candidate : system_font_dirs()) {
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
      chosen = candidate.string();
      break;
    }
  }
  if (chosen.empty() || !find_system_font_file()) return;

  FontRegistry registry;
  registry.addOsFallbackDir(chosen);
  Typography typography;
  typography.size = 12.0f;
  auto run = registry.layoutText("Hi", typography, 1.0f, true);
  REQUIRE(run);
  CHECK(!run->glyphs.empty());
}

TEST_CASE("spacing_widens_run") {
  FontRegistry registry;
  for (auto const& dir : system_font_dirs()) registry.addOsFallbackDir(dir.string());

  Typography base;
  base.size = 14.0f;
  auto baseRun = registry.layoutText("A B", base, 1.0f, false);
  if (!baseRun) return;

  Typography spaced = base;
  spaced.letterSpacing = 0.5f;
  spaced.wordSpacing = 0.5f;
  spaced.features = "kern=1,liga=1";
  spaced.locale = "en";
  auto spacedRun = registry.layoutText("A B", spaced, 1.0f, false);
  REQUIRE(spacedRun);
  CHECK(spacedRun->width >= baseRun->width);
}
#endif

TEST_SUITE_END();
