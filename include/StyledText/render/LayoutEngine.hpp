#pragma once

#include "StyledText/render/Geometry.hpp"
#include "StyledText/render/TextStorage.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>

namespace StyledText {

// Region text is laid out into. Measurement leaves it at the measured size
// and records the width it broke lines at, so later rasterization and hit
// testing see the same line breaks.
struct TextContainer {
  Size size{UnboundedWidth, UnboundedWidth};
  float layoutWidth = UnboundedWidth;
  // 0 means unlimited.
  int32_t maximumNumberOfLines = 0;
};

struct CharacterHit {
  static constexpr size_t NotFound = std::numeric_limits<size_t>::max();

  size_t index = NotFound;
  // Position of the point between the insertion points before and after
  // the character; 1.0 means at or beyond the trailing one.
  float fraction = 1.0f;

  bool found() const { return index != NotFound; }
};

// Layout and rasterization backend. Engines are not internally
// synchronized; the renderer owning one serializes every call.
class TextLayoutEngine {
public:
  virtual ~TextLayoutEngine() = default;

  // Lays the storage out at the given width and returns the used size
  // snapped up to the pixel grid. Leaves container.size at that size and
  // container.layoutWidth at width.
  virtual auto measure(TextContainer& container,
                       TextStorage const& storage,
                       float width,
                       float scale) -> Size = 0;

  // Returns nullptr for an empty size.
  virtual auto rasterize(TextContainer const& container,
                         TextStorage const& storage,
                         Size size,
                         float scale,
                         std::optional<Color> backgroundColor) -> std::shared_ptr<const Bitmap> = 0;

  // Nearest character to a point in container coordinates.
  virtual auto characterIndex(TextContainer const& container,
                              TextStorage const& storage,
                              Point point,
                              float scale) -> CharacterHit = 0;

  // Engines that can produce different output for the same storage and
  // parameters must report different identities. Folded into cache keys.
  virtual auto cacheIdentity() const -> uint64_t = 0;
};

} // namespace StyledText
