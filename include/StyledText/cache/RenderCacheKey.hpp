#pragma once

#include "StyledText/render/Geometry.hpp"
#include "StyledText/render/TextStorage.hpp"
#include "StyledText/text/StyledTextRun.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace StyledText {

// Every input that changes measured geometry or pixels. Two keys built from
// runs with equal text and attributes compare equal, whichever renderer or
// storage produced them, as long as the engines report the same identity.
struct RenderCacheKey {
  float width = UnboundedWidth;
  uint64_t contentHash = 0;
  std::shared_ptr<const StyledTextRun> content;
  std::optional<Color> backgroundColor;
  int32_t maximumNumberOfLines = 0;
  float scale = 1.0f;
  float insetWidth = 0.0f;
  // TextLayoutEngine::cacheIdentity() of the engine producing the value.
  uint64_t engineIdentity = 0;

  // A NaN width is stored as UnboundedWidth so it can compare equal.
  static auto make(float width,
                   TextStorage const& storage,
                   std::optional<Color> backgroundColor,
                   int32_t maximumNumberOfLines,
                   float scale,
                   float insetWidth,
                   uint64_t engineIdentity = 0) -> RenderCacheKey;

  bool operator==(RenderCacheKey const& other) const;
};

struct RenderCacheKeyHash {
  auto operator()(RenderCacheKey const& key) const -> size_t;
};

} // namespace StyledText
