#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace StyledText {

inline constexpr float UnboundedWidth = std::numeric_limits<float>::infinity();

struct Color {
  uint8_t r{};
  uint8_t g{};
  uint8_t b{};
  uint8_t a{};

  bool operator==(Color const& other) const = default;
};

constexpr auto PackRGBA8(Color c) -> uint32_t {
  return static_cast<uint32_t>(c.r) |
         (static_cast<uint32_t>(c.g) << 8) |
         (static_cast<uint32_t>(c.b) << 16) |
         (static_cast<uint32_t>(c.a) << 24);
}

struct Point {
  float x = 0.0f;
  float y = 0.0f;
};

struct EdgeInsets {
  float top = 0.0f;
  float left = 0.0f;
  float bottom = 0.0f;
  float right = 0.0f;

  float horizontal() const { return left + right; }
  float vertical() const { return top + bottom; }

  bool operator==(EdgeInsets const& other) const = default;
};

struct Size {
  float width = 0.0f;
  float height = 0.0f;

  bool operator==(Size const& other) const = default;

  bool empty() const { return !(width > 0.0f) || !(height > 0.0f); }

  // Rounds each dimension up to the next whole device pixel.
  auto snapped(float scale) const -> Size {
    float s = scale > 0.0f ? scale : 1.0f;
    return Size{std::ceil(width * s) / s, std::ceil(height * s) / s};
  }

  auto resized(EdgeInsets const& inset) const -> Size {
    return Size{width + inset.horizontal(), height + inset.vertical()};
  }
};

// RGBA8 pixels, straight alpha, rows top to bottom.
struct Bitmap {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t strideBytes = 0;
  float scale = 1.0f;
  std::vector<uint8_t> pixels;

  auto byteSize() const -> size_t { return pixels.size(); }

  auto pixelAt(uint32_t x, uint32_t y) const -> Color {
    if (x >= width || y >= height) return Color{};
    size_t idx = static_cast<size_t>(y) * strideBytes + static_cast<size_t>(x) * 4u;
    return Color{pixels[idx + 0], pixels[idx + 1], pixels[idx + 2], pixels[idx + 3]};
  }
};

} // namespace StyledText
