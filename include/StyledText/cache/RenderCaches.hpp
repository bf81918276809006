#pragma once

#include "StyledText/cache/BoundedCache.hpp"
#include "StyledText/cache/RenderCacheKey.hpp"
#include "StyledText/render/Geometry.hpp"

#include <cstddef>
#include <memory>

namespace StyledText {

// Sizes cost one unit each; bitmaps cost their pixel bytes.
using SizeCache = BoundedCache<RenderCacheKey, Size, RenderCacheKeyHash>;
using BitmapCache = BoundedCache<RenderCacheKey, std::shared_ptr<const Bitmap>, RenderCacheKeyHash>;

inline constexpr size_t DefaultSizeCacheMaxCount = 1000;
inline constexpr size_t DefaultBitmapCacheMaxBytes = 20u * 1024u * 1024u;

struct RenderCacheConfig {
  size_t sizeCacheMaxCount = DefaultSizeCacheMaxCount;
  size_t bitmapCacheMaxBytes = DefaultBitmapCacheMaxBytes;
  CompactionPolicy compaction = CompactionPolicy::Default();
  bool clearOnMemoryWarning = true;

  // Applies STYLEDTEXT_SIZE_CACHE_MAX and STYLEDTEXT_BITMAP_CACHE_MAX_BYTES
  // over the defaults. Values that are not positive integers are ignored.
  static auto FromEnvironment() -> RenderCacheConfig;
};

auto MakeSizeCache(size_t maxCount,
                   CompactionPolicy compaction = CompactionPolicy::Default(),
                   bool clearOnMemoryWarning = false) -> std::shared_ptr<SizeCache>;
auto MakeBitmapCache(size_t maxBytes,
                     CompactionPolicy compaction = CompactionPolicy::Default(),
                     bool clearOnMemoryWarning = false) -> std::shared_ptr<BitmapCache>;

// Process-wide defaults, created on first use and never destroyed.
auto GlobalSizeCache() -> std::shared_ptr<SizeCache> const&;
auto GlobalBitmapCache() -> std::shared_ptr<BitmapCache> const&;

} // namespace StyledText
