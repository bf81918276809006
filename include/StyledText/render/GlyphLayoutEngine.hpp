#pragma once

#include "StyledText/render/LayoutEngine.hpp"
#include "StyledText/text/FontRegistry.hpp"

#include <cstdint>
#include <memory>

namespace StyledText {

// Default engine: HarfBuzz shaping and FreeType glyphs through the font
// registry, the 5x7 bitmap font for family "bitmap" or when no face
// resolves. Left to right, greedy word wrap, hard breaks at '\n'.
class GlyphLayoutEngine final : public TextLayoutEngine {
public:
  explicit GlyphLayoutEngine(FontRegistry& registry = GetFontRegistry());
  ~GlyphLayoutEngine() override;

  GlyphLayoutEngine(GlyphLayoutEngine const&) = delete;
  GlyphLayoutEngine& operator=(GlyphLayoutEngine const&) = delete;

  auto measure(TextContainer& container,
               TextStorage const& storage,
               float width,
               float scale) -> Size override;

  auto rasterize(TextContainer const& container,
                 TextStorage const& storage,
                 Size size,
                 float scale,
                 std::optional<Color> backgroundColor) -> std::shared_ptr<const Bitmap> override;

  auto characterIndex(TextContainer const& container,
                      TextStorage const& storage,
                      Point point,
                      float scale) -> CharacterHit override;

  // Registry address and font generation.
  auto cacheIdentity() const -> uint64_t override;

  // Number of line-breaking passes run so far.
  auto layoutCount() const -> uint64_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};

} // namespace StyledText
