#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace StyledText {

enum class GlyphBitmapFormat : uint8_t {
  Mask8 = 0,
  ColorBGRA = 1,
};

struct GlyphAtlas;

struct GlyphBitmap {
  int32_t width = 0;
  int32_t height = 0;
  int32_t bearingX = 0;
  int32_t bearingY = 0;
  int32_t advance = 0;
  int32_t stride = 0;
  GlyphBitmapFormat format = GlyphBitmapFormat::Mask8;
  std::vector<uint8_t> pixels;
  std::shared_ptr<GlyphAtlas> atlas;
  int32_t atlasX = 0;
  int32_t atlasY = 0;

  // Row pointer into either the private pixels or the atlas page.
  auto row(int32_t y) const -> uint8_t const*;
};

struct GlyphAtlas {
  int32_t width = 0;
  int32_t height = 0;
  int32_t stride = 0;
  int32_t cursorX = 0;
  int32_t cursorY = 0;
  int32_t rowHeight = 0;
  std::vector<uint8_t> pixels;
};

inline auto GlyphBitmap::row(int32_t y) const -> uint8_t const* {
  if (y < 0 || y >= height) return nullptr;
  if (!pixels.empty()) {
    return pixels.data() + static_cast<size_t>(y) * static_cast<size_t>(stride);
  }
  if (!atlas) return nullptr;
  return atlas->pixels.data() + static_cast<size_t>(atlasY + y) * static_cast<size_t>(atlas->stride) +
         static_cast<size_t>(atlasX);
}

struct GlyphPlacement {
  GlyphBitmap* bitmap = nullptr;
  int32_t glyphId = 0;
  float x = 0.0f;
  float y = 0.0f;
  float advance = 0.0f;
  // Byte offset of the source cluster within the shaped text.
  uint32_t cluster = 0;
};

// Shaped single-line text in logical units.
struct TextRun {
  std::vector<GlyphPlacement> glyphs;
  float width = 0.0f;
  float height = 0.0f;
  float baseline = 0.0f;
  float descent = 0.0f;
  float layoutScale = 1.0f;
  uint64_t contentHash = 0;
};

} // namespace StyledText
