#pragma once

#include "StyledText/cache/RenderCaches.hpp"
#include "StyledText/render/GlyphLayoutEngine.hpp"
#include "StyledText/render/StyledTextRenderer.hpp"
#include "StyledText/text/StyledString.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace StyledTextTest {

using namespace StyledText;

struct EngineCalls {
  std::atomic<int> measure{0};
  std::atomic<int> rasterize{0};
  std::atomic<int> characterIndex{0};
};

// Default engine with call counters, so tests can tell cache hits from
// fresh layout work.
class CountingEngine final : public TextLayoutEngine {
public:
  explicit CountingEngine(std::shared_ptr<EngineCalls> counters) : calls(std::move(counters)) {}

  auto measure(TextContainer& container, TextStorage const& storage, float width, float scale) -> Size override {
    ++calls->measure;
    return inner.measure(container, storage, width, scale);
  }

  auto rasterize(TextContainer const& container,
                 TextStorage const& storage,
                 Size size,
                 float scale,
                 std::optional<Color> backgroundColor) -> std::shared_ptr<const Bitmap> override {
    ++calls->rasterize;
    return inner.rasterize(container, storage, size, scale, backgroundColor);
  }

  auto characterIndex(TextContainer const& container,
                      TextStorage const& storage,
                      Point point,
                      float scale) -> CharacterHit override {
    ++calls->characterIndex;
    return inner.characterIndex(container, storage, point, scale);
  }

  auto cacheIdentity() const -> uint64_t override { return inner.cacheIdentity(); }

private:
  std::shared_ptr<EngineCalls> calls;
  GlyphLayoutEngine inner;
};

// Bitmap font keeps metrics exact: at size 14 every character is 12 wide
// and lines are 14 tall.
inline auto bitmap_style(float size = 14.0f, Color color = Color{0, 0, 0, 255}) -> TextStyle {
  TextStyle style;
  style.typography.family = std::string(BitmapFontFamily);
  style.typography.size = size;
  style.color = color;
  return style;
}

inline auto make_string(std::string_view text, float size = 14.0f) -> std::shared_ptr<const StyledTextString> {
  return StyledTextBuilder(bitmap_style(size)).add(text).build();
}

struct IsolatedCaches {
  std::shared_ptr<SizeCache> sizes = MakeSizeCache(DefaultSizeCacheMaxCount);
  std::shared_ptr<BitmapCache> bitmaps = MakeBitmapCache(DefaultBitmapCacheMaxBytes);
};

inline auto make_options(IsolatedCaches const& caches,
                         std::shared_ptr<EngineCalls> calls = nullptr) -> RendererOptions {
  RendererOptions options;
  options.sizeCache = caches.sizes;
  options.bitmapCache = caches.bitmaps;
  if (calls) options.engine = std::make_unique<CountingEngine>(std::move(calls));
  return options;
}

} // namespace StyledTextTest
