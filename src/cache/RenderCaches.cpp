#include "StyledText/cache/RenderCaches.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace StyledText {
namespace {

void apply_env_override(char const* name, size_t& value) {
  char const* env = std::getenv(name);
  if (!env) return;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(env, &end, 10);
  if (end != env && *end == '\0' && parsed > 0) {
    value = static_cast<size_t>(parsed);
    return;
  }
  spdlog::warn("RenderCaches: ignoring {}='{}', keeping {}", name, env, value);
}

auto shared_config() -> RenderCacheConfig const& {
  static RenderCacheConfig const config = RenderCacheConfig::FromEnvironment();
  return config;
}

} // namespace

auto RenderCacheConfig::FromEnvironment() -> RenderCacheConfig {
  RenderCacheConfig config;
  apply_env_override("STYLEDTEXT_SIZE_CACHE_MAX", config.sizeCacheMaxCount);
  apply_env_override("STYLEDTEXT_BITMAP_CACHE_MAX_BYTES", config.bitmapCacheMaxBytes);
  return config;
}

auto MakeSizeCache(size_t maxCount,
                   CompactionPolicy compaction,
                   bool clearOnMemoryWarning) -> std::shared_ptr<SizeCache> {
  return std::make_shared<SizeCache>(maxCount, SizeCache::CostFunction{}, compaction,
                                     clearOnMemoryWarning, "size");
}

auto MakeBitmapCache(size_t maxBytes,
                     CompactionPolicy compaction,
                     bool clearOnMemoryWarning) -> std::shared_ptr<BitmapCache> {
  auto cost = [](std::shared_ptr<const Bitmap> const& bitmap) -> size_t {
    return bitmap ? bitmap->byteSize() : 0u;
  };
  return std::make_shared<BitmapCache>(maxBytes, cost, compaction, clearOnMemoryWarning, "bitmap");
}

auto GlobalSizeCache() -> std::shared_ptr<SizeCache> const& {
  static auto* cache = [] {
    RenderCacheConfig const& config = shared_config();
    spdlog::info("RenderCaches: global size cache created (max {} items)", config.sizeCacheMaxCount);
    return new std::shared_ptr<SizeCache>(
        MakeSizeCache(config.sizeCacheMaxCount, config.compaction, config.clearOnMemoryWarning));
  }();
  return *cache;
}

auto GlobalBitmapCache() -> std::shared_ptr<BitmapCache> const& {
  static auto* cache = [] {
    RenderCacheConfig const& config = shared_config();
    spdlog::info("RenderCaches: global bitmap cache created (max {} bytes)", config.bitmapCacheMaxBytes);
    return new std::shared_ptr<BitmapCache>(
        MakeBitmapCache(config.bitmapCacheMaxBytes, config.compaction, config.clearOnMemoryWarning));
  }();
  return *cache;
}

} // namespace StyledText
