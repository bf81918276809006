#include "StyledText/cache/RenderCaches.hpp"

#include <doctest/doctest.h>

#include <cstdlib>

using namespace StyledText;

TEST_SUITE_BEGIN("styledtext.global_caches");

TEST_CASE("global_caches_are_singletons") {
  auto const& sizes = GlobalSizeCache();
  auto const& bitmaps = GlobalBitmapCache();
  REQUIRE(sizes);
  REQUIRE(bitmaps);
  CHECK(sizes.get() == GlobalSizeCache().get());
  CHECK(bitmaps.get() == GlobalBitmapCache().get());
  CHECK(sizes->name() == "size");
  CHECK(bitmaps->name() == "bitmap");
}

TEST_CASE("default_config_values") {
  RenderCacheConfig config;
  CHECK(config.sizeCacheMaxCount == 1000u);
  CHECK(config.bitmapCacheMaxBytes == 20u * 1024u * 1024u);
  CHECK(config.clearOnMemoryWarning);
  CHECK(config.compaction.ratio == doctest::Approx(1.0f));
}

TEST_CASE("environment_overrides") {
  setenv("STYLEDTEXT_SIZE_CACHE_MAX", "42", 1);
  setenv("STYLEDTEXT_BITMAP_CACHE_MAX_BYTES", "4096", 1);
  RenderCacheConfig config = RenderCacheConfig::FromEnvironment();
  CHECK(config.sizeCacheMaxCount == 42u);
  CHECK(config.bitmapCacheMaxBytes == 4096u);

  setenv("STYLEDTEXT_SIZE_CACHE_MAX", "lots", 1);
  setenv("STYLEDTEXT_BITMAP_CACHE_MAX_BYTES", "0", 1);
  config = RenderCacheConfig::FromEnvironment();
  CHECK_MESSAGE(config.sizeCacheMaxCount == DefaultSizeCacheMaxCount, "non-numeric value ignored");
  CHECK_MESSAGE(config.bitmapCacheMaxBytes == DefaultBitmapCacheMaxBytes, "zero ignored");

  unsetenv("STYLEDTEXT_SIZE_CACHE_MAX");
  unsetenv("STYLEDTEXT_BITMAP_CACHE_MAX_BYTES");
}

TEST_CASE("bitmap_cache_costs_bytes") {
  auto cache = MakeBitmapCache(1024);
  auto bitmap = std::make_shared<Bitmap>();
  bitmap->width = 8;
  bitmap->height = 8;
  bitmap->strideBytes = 32;
  bitmap->pixels.assign(256, 0u);

  TextStorage storage(StyledTextRun::Make({}), ContentSizeCategory::Large);
  RenderCacheKey key = RenderCacheKey::make(10.0f, storage, std::nullopt, 0, 1.0f, 0.0f);
  CHECK(cache->set(key, bitmap));
  CHECK(cache->totalCost() == 256u);
}

TEST_SUITE_END();
