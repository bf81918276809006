#include "StyledText/cache/RenderCacheKey.hpp"

#include "StyledText/util/Hash.hpp"

#include <cmath>

namespace StyledText {

auto RenderCacheKey::make(float width,
                          TextStorage const& storage,
                          std::optional<Color> backgroundColor,
                          int32_t maximumNumberOfLines,
                          float scale,
                          float insetWidth,
                          uint64_t engineIdentity) -> RenderCacheKey {
  RenderCacheKey key;
  key.width = std::isnan(width) ? UnboundedWidth : width;
  key.content = storage.run();
  key.contentHash = key.content ? key.content->contentHash() : 0;
  key.backgroundColor = backgroundColor;
  key.maximumNumberOfLines = maximumNumberOfLines;
  key.scale = scale;
  key.insetWidth = insetWidth;
  key.engineIdentity = engineIdentity;
  return key;
}

bool RenderCacheKey::operator==(RenderCacheKey const& other) const {
  if (width != other.width || contentHash != other.contentHash ||
      backgroundColor != other.backgroundColor ||
      maximumNumberOfLines != other.maximumNumberOfLines ||
      scale != other.scale || insetWidth != other.insetWidth ||
      engineIdentity != other.engineIdentity) {
    return false;
  }
  if (content == other.content) return true;
  if (!content || !other.content) return false;
  return *content == *other.content;
}

auto RenderCacheKeyHash::operator()(RenderCacheKey const& key) const -> size_t {
  uint64_t h = Fnv1aOffset;
  h = HashFloat(h, key.width);
  h = Fnv1aMix(h, key.contentHash);
  if (key.backgroundColor) {
    h = Fnv1aMix(h, 1u);
    h = Fnv1aMix(h, PackRGBA8(*key.backgroundColor));
  } else {
    h = Fnv1aMix(h, 0u);
  }
  h = Fnv1aMix(h, static_cast<uint32_t>(key.maximumNumberOfLines));
  h = HashFloat(h, key.scale);
  h = HashFloat(h, key.insetWidth);
  h = Fnv1aMix(h, key.engineIdentity);
  return static_cast<size_t>(h);
}

} // namespace StyledText
