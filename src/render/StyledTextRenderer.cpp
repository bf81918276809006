#include "StyledText/render/StyledTextRenderer.hpp"

#include "StyledText/render/GlyphLayoutEngine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace StyledText {
namespace {

// NaN widths measure unbounded and must share that cache entry.
auto request_width(float width) -> float {
  return std::isnan(width) ? UnboundedWidth : width;
}

} // namespace

struct StyledTextRenderer::Impl {
  std::shared_ptr<const StyledTextString> string;
  ContentSizeCategory category = ContentSizeCategory::Large;
  EdgeInsets inset;
  std::optional<Color> backgroundColor;
  float scale = DefaultScreenScale;
  std::unique_ptr<TextLayoutEngine> engine;
  std::shared_ptr<SizeCache> sizeCache;
  std::shared_ptr<BitmapCache> bitmapCache;

  // Guarded by mutex.
  TextContainer container;
  std::unordered_map<ContentSizeCategory, std::unique_ptr<TextStorage>> storages;
  mutable std::mutex mutex;

  auto storageLocked() -> TextStorage const& {
    auto& slot = storages[category];
    if (!slot) {
      auto run = string ? string->render(category) : StyledTextRun::Make({});
      slot = std::make_unique<TextStorage>(std::move(run), category);
      if (!slot->bind(engine.get())) {
        spdlog::warn("StyledTextRenderer: storage for {} is bound to another engine", ToString(category));
      }
      spdlog::debug("StyledTextRenderer: built storage for {} ({} characters)",
                    ToString(category), slot->run()->characterCount());
    }
    return *slot;
  }

  auto keyLocked(float width, TextStorage const& storage) const -> RenderCacheKey {
    return RenderCacheKey::make(width, storage, backgroundColor, container.maximumNumberOfLines, scale,
                                inset.horizontal(), engine->cacheIdentity());
  }

  auto sizeLocked(RenderCacheKey const& key, TextStorage const& storage, float width) -> Size {
    float insetWidth = std::max(width - inset.left - inset.right, 0.0f);
    if (auto cached = sizeCache->get(key)) {
      container.size = *cached;
      container.layoutWidth = insetWidth;
      return *cached;
    }
    spdlog::debug("StyledTextRenderer: measuring width {} (layout width {}) for {}",
                  width, insetWidth, ToString(category));
    Size measured = engine->measure(container, storage, insetWidth, scale);
    if (!sizeCache->set(key, measured)) {
      spdlog::debug("StyledTextRenderer: size for width {} not cached", width);
    }
    return measured;
  }

  auto renderLocked(float width) -> RenderResult {
    TextStorage const& storage = storageLocked();
    RenderCacheKey key = keyLocked(width, storage);
    Size size = sizeLocked(key, storage, width);
    if (auto cached = bitmapCache->get(key)) {
      return RenderResult{*cached, size};
    }
    spdlog::debug("StyledTextRenderer: rasterizing {}x{} at scale {}", size.width, size.height, scale);
    auto bitmap = engine->rasterize(container, storage, size, scale, backgroundColor);
    if (bitmap && !bitmapCache->set(key, bitmap)) {
      spdlog::debug("StyledTextRenderer: bitmap of {} bytes not cached", bitmap->byteSize());
    }
    return RenderResult{std::move(bitmap), size};
  }
};

StyledTextRenderer::StyledTextRenderer(std::shared_ptr<const StyledTextString> string,
                                       ContentSizeCategory category,
                                       RendererOptions options)
    : impl(std::make_unique<Impl>()) {
  impl->string = string ? std::move(string) : std::make_shared<const StyledTextString>();
  impl->category = category;
  impl->inset = options.inset;
  impl->backgroundColor = options.backgroundColor;
  impl->scale = options.scale > 0.0f ? options.scale : DefaultScreenScale;
  impl->engine = options.engine ? std::move(options.engine) : std::make_unique<GlyphLayoutEngine>();
  impl->sizeCache = options.sizeCache ? std::move(options.sizeCache) : GlobalSizeCache();
  impl->bitmapCache = options.bitmapCache ? std::move(options.bitmapCache) : GlobalBitmapCache();
  impl->container.maximumNumberOfLines = std::max(options.maximumNumberOfLines, 0);
}

StyledTextRenderer::~StyledTextRenderer() = default;

auto StyledTextRenderer::size(float width) -> Size {
  width = request_width(width);
  std::lock_guard<std::mutex> lock(impl->mutex);
  TextStorage const& storage = impl->storageLocked();
  return impl->sizeLocked(impl->keyLocked(width, storage), storage, width);
}

auto StyledTextRenderer::viewSize(float width) -> Size {
  return size(width).resized(impl->inset);
}

auto StyledTextRenderer::render(float width) -> RenderResult {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->renderLocked(request_width(width));
}

auto StyledTextRenderer::cachedRender(float width) -> CachedRenderResult {
  std::lock_guard<std::mutex> lock(impl->mutex);
  RenderCacheKey key = impl->keyLocked(request_width(width), impl->storageLocked());
  CachedRenderResult result;
  result.size = impl->sizeCache->peek(key);
  if (auto bitmap = impl->bitmapCache->peek(key)) result.bitmap = std::move(*bitmap);
  return result;
}

auto StyledTextRenderer::attributes(Point point) -> std::optional<AttributeHit> {
  std::lock_guard<std::mutex> lock(impl->mutex);
  TextStorage const& storage = impl->storageLocked();
  CharacterHit hit = impl->engine->characterIndex(impl->container, storage, point, impl->scale);
  if (!hit.found() || hit.fraction >= 1.0f) return std::nullopt;
  ResolvedSpan const* span = storage.run()->spanAt(hit.index);
  if (!span) return std::nullopt;
  return AttributeHit{span->attributes, hit.index};
}

auto StyledTextRenderer::warm(float width, WarmOption option) -> StyledTextRenderer& {
  switch (option) {
    case WarmOption::Size:
      size(width);
      break;
    case WarmOption::Bitmap:
      render(width);
      break;
  }
  return *this;
}

auto StyledTextRenderer::clearCaches() -> StyledTextRenderer& {
  size_t sizes = impl->sizeCache->clear();
  size_t bitmaps = impl->bitmapCache->clear();
  spdlog::debug("StyledTextRenderer: cleared {} sizes and {} bitmaps", sizes, bitmaps);
  return *this;
}

void StyledTextRenderer::setContentSizeCategory(ContentSizeCategory category) {
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->category = category;
}

auto StyledTextRenderer::contentSizeCategory() const -> ContentSizeCategory {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->category;
}

void StyledTextRenderer::setMaximumNumberOfLines(int32_t lines) {
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->container.maximumNumberOfLines = std::max(lines, 0);
}

auto StyledTextRenderer::maximumNumberOfLines() const -> int32_t {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->container.maximumNumberOfLines;
}

auto StyledTextRenderer::string() const -> std::shared_ptr<const StyledTextString> const& {
  return impl->string;
}

auto StyledTextRenderer::inset() const -> EdgeInsets {
  return impl->inset;
}

auto StyledTextRenderer::backgroundColor() const -> std::optional<Color> {
  return impl->backgroundColor;
}

auto StyledTextRenderer::scale() const -> float {
  return impl->scale;
}

auto StyledTextRenderer::sizeCache() const -> std::shared_ptr<SizeCache> const& {
  return impl->sizeCache;
}

auto StyledTextRenderer::bitmapCache() const -> std::shared_ptr<BitmapCache> const& {
  return impl->bitmapCache;
}

auto StyledTextRenderer::storageCount() const -> size_t {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->storages.size();
}

} // namespace StyledText
