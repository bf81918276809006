#pragma once

#include "StyledText/cache/RenderCaches.hpp"
#include "StyledText/render/Geometry.hpp"
#include "StyledText/render/LayoutEngine.hpp"
#include "StyledText/text/ContentSizeCategory.hpp"
#include "StyledText/text/StyledString.hpp"
#include "StyledText/text/StyledTextRun.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace StyledText {

inline constexpr float DefaultScreenScale = 2.0f;

struct RendererOptions {
  EdgeInsets inset;
  std::optional<Color> backgroundColor;
  float scale = DefaultScreenScale;
  int32_t maximumNumberOfLines = 0;
  // Defaults to a GlyphLayoutEngine on the shared font registry.
  std::unique_ptr<TextLayoutEngine> engine;
  // Default to GlobalSizeCache() / GlobalBitmapCache().
  std::shared_ptr<SizeCache> sizeCache;
  std::shared_ptr<BitmapCache> bitmapCache;
};

enum class WarmOption : uint8_t {
  Size = 0,
  Bitmap,
};

struct RenderResult {
  std::shared_ptr<const Bitmap> bitmap;
  Size size;
};

struct CachedRenderResult {
  std::shared_ptr<const Bitmap> bitmap;
  std::optional<Size> size;
};

struct AttributeHit {
  TextAttributes attributes;
  size_t index = 0;
};

// Measures and rasterizes one styled string, memoizing through the shared
// size and bitmap caches. Every public call is safe from any thread; calls
// on one renderer are serialized, calls on different renderers only meet
// inside the caches.
class StyledTextRenderer {
public:
  StyledTextRenderer(std::shared_ptr<const StyledTextString> string,
                     ContentSizeCategory category,
                     RendererOptions options = {});
  ~StyledTextRenderer();

  StyledTextRenderer(StyledTextRenderer const&) = delete;
  StyledTextRenderer& operator=(StyledTextRenderer const&) = delete;

  auto size(float width = UnboundedWidth) -> Size;
  // size(width) grown by the inset on every edge.
  auto viewSize(float width = UnboundedWidth) -> Size;
  auto render(float width = UnboundedWidth) -> RenderResult;
  // Never measures or rasterizes; reports only what the caches hold.
  auto cachedRender(float width = UnboundedWidth) -> CachedRenderResult;
  // Point in text container coordinates, inset excluded.
  auto attributes(Point point) -> std::optional<AttributeHit>;

  auto warm(float width = UnboundedWidth, WarmOption option = WarmOption::Size) -> StyledTextRenderer&;
  // Empties both caches. With the global caches this affects every renderer
  // sharing them.
  auto clearCaches() -> StyledTextRenderer&;

  void setContentSizeCategory(ContentSizeCategory category);
  auto contentSizeCategory() const -> ContentSizeCategory;
  void setMaximumNumberOfLines(int32_t lines);
  auto maximumNumberOfLines() const -> int32_t;

  auto string() const -> std::shared_ptr<const StyledTextString> const&;
  auto inset() const -> EdgeInsets;
  auto backgroundColor() const -> std::optional<Color>;
  auto scale() const -> float;
  auto sizeCache() const -> std::shared_ptr<SizeCache> const&;
  auto bitmapCache() const -> std::shared_ptr<BitmapCache> const&;
  // Number of categories with built storage.
  auto storageCount() const -> size_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};

} // namespace StyledText
