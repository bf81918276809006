#include "StyledText/render/GlyphLayoutEngine.hpp"

#include "StyledText/util/BitmapFont.hpp"
#include "StyledText/util/Hash.hpp"
#include "StyledText/util/Utf8.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace StyledText {
namespace {

constexpr float WrapEpsilon = 1e-3f;
constexpr size_t NoBreak = static_cast<size_t>(-1);

bool is_break_space(uint32_t cp) {
  return cp == ' ' || cp == '\t';
}

struct LineMetrics {
  float ascent = 0.0f;
  float descent = 0.0f;
  float lineHeight = 0.0f;
};

// Glyph offset from the origin of the character that owns it.
struct ShapedGlyph {
  GlyphBitmap const* bitmap = nullptr;
  float dx = 0.0f;
  float dy = 0.0f;
};

// One code point of the run, in run order.
struct CharBox {
  uint32_t codepoint = 0;
  Color color{};
  float advance = 0.0f;
  LineMetrics metrics;
  bool bitmapFont = true;
  float fontScale = 0.0f;
  uint32_t glyphBegin = 0;
  uint32_t glyphEnd = 0;
  // Line-relative pen position, assigned by line breaking.
  float x = 0.0f;
};

struct Line {
  size_t begin = 0;
  size_t end = 0;
  float top = 0.0f;
  float height = 0.0f;
  float baseline = 0.0f;
  float width = 0.0f;
};

auto resolve_spacing(float spacing, float reference) -> float {
  return std::abs(spacing) <= 1.0f ? spacing * reference : spacing;
}

auto bitmap_metrics(Typography const& typography) -> LineMetrics {
  float s = UiFontScale(typography.size);
  LineMetrics metrics;
  metrics.ascent = static_cast<float>(UiFontHeight) * s;
  metrics.lineHeight = typography.lineHeight > 0.0f ? typography.lineHeight : metrics.ascent;
  return metrics;
}

auto sanitize_scale(float scale) -> float {
  return scale > 0.0f ? scale : 1.0f;
}

inline auto mul_div_255(uint32_t v, uint32_t a) -> uint32_t {
  return (v * a + 127u) / 255u;
}

// Source-over of a premultiplied source onto a straight-alpha pixel.
void blend_premultiplied(uint8_t* dst, uint32_t srcR, uint32_t srcG, uint32_t srcB, uint32_t srcA) {
  if (srcA == 0) return;
  uint32_t dstA = dst[3];
  uint32_t invA = 255u - srcA;
  uint32_t outA = srcA + mul_div_255(dstA, invA);
  if (outA == 0) return;
  auto channel = [&](uint8_t d, uint32_t s) -> uint8_t {
    uint32_t premul = s + mul_div_255(mul_div_255(d, dstA), invA);
    return static_cast<uint8_t>(std::min<uint32_t>(255u, (premul * 255u + outA / 2u) / outA));
  };
  dst[0] = channel(dst[0], srcR);
  dst[1] = channel(dst[1], srcG);
  dst[2] = channel(dst[2], srcB);
  dst[3] = static_cast<uint8_t>(std::min<uint32_t>(255u, outA));
}

void blend_coverage(uint8_t* dst, Color color, uint8_t coverage) {
  uint32_t a = mul_div_255(color.a, coverage);
  blend_premultiplied(dst, mul_div_255(color.r, a), mul_div_255(color.g, a), mul_div_255(color.b, a), a);
}

auto pixel_ptr(Bitmap& bitmap, int x, int y) -> uint8_t* {
  return bitmap.pixels.data() + static_cast<size_t>(y) * bitmap.strideBytes + static_cast<size_t>(x) * 4u;
}

void fill_rect(Bitmap& bitmap, long x0, long y0, long x1, long y1, Color color) {
  x0 = std::max(x0, 0L);
  y0 = std::max(y0, 0L);
  x1 = std::min(x1, static_cast<long>(bitmap.width));
  y1 = std::min(y1, static_cast<long>(bitmap.height));
  for (long y = y0; y < y1; ++y) {
    for (long x = x0; x < x1; ++x) {
      blend_coverage(pixel_ptr(bitmap, static_cast<int>(x), static_cast<int>(y)), color, 255u);
    }
  }
}

void blit_glyph(Bitmap& bitmap, GlyphBitmap const& glyph, long originX, long originY, Color color) {
  for (int32_t gy = 0; gy < glyph.height; ++gy) {
    long y = originY + gy;
    if (y < 0 || y >= static_cast<long>(bitmap.height)) continue;
    uint8_t const* row = glyph.row(gy);
    if (!row) continue;
    for (int32_t gx = 0; gx < glyph.width; ++gx) {
      long x = originX + gx;
      if (x < 0 || x >= static_cast<long>(bitmap.width)) continue;
      uint8_t* dst = pixel_ptr(bitmap, static_cast<int>(x), static_cast<int>(y));
      if (glyph.format == GlyphBitmapFormat::ColorBGRA) {
        uint8_t const* src = row + static_cast<size_t>(gx) * 4u;
        blend_premultiplied(dst, src[2], src[1], src[0], src[3]);
      } else {
        blend_coverage(dst, color, row[gx]);
      }
    }
  }
}

} // namespace

struct GlyphLayoutEngine::Impl {
  explicit Impl(FontRegistry& fonts) : registry(fonts) {}

  FontRegistry& registry;

  std::shared_ptr<const StyledTextRun> shapedRun;
  float shapedScale = 0.0f;
  std::vector<CharBox> chars;
  std::vector<ShapedGlyph> glyphs;

  bool linesValid = false;
  float lineWidth = 0.0f;
  int32_t lineLimit = 0;
  std::vector<Line> lines;
  Size used;
  uint64_t layouts = 0;

  auto metricsFor(Typography const& typography, float scale) -> LineMetrics {
    if (typography.family != BitmapFontFamily) {
      if (auto run = registry.layoutText(" ", typography, scale, false)) {
        return LineMetrics{run->baseline, run->descent, run->height};
      }
    }
    return bitmap_metrics(typography);
  }

  void shapeBitmap(ResolvedSpan const& span, std::vector<Utf8Codepoint> const& cps, size_t begin, size_t end) {
    Typography const& typography = span.attributes.typography;
    float s = UiFontScale(typography.size);
    float base = static_cast<float>(UiFontAdvance) * s;
    float letterSpacing = resolve_spacing(typography.letterSpacing, typography.size);
    LineMetrics metrics = bitmap_metrics(typography);
    for (size_t i = begin; i < end; ++i) {
      CharBox box;
      box.codepoint = cps[i].codepoint;
      box.color = span.attributes.color;
      box.metrics = metrics;
      box.bitmapFont = true;
      box.fontScale = s;
      box.advance = base + letterSpacing;
      if (is_break_space(box.codepoint) && typography.wordSpacing != 0.0f) {
        box.advance += resolve_spacing(typography.wordSpacing, base);
      }
      box.advance = std::max(box.advance, 0.0f);
      box.glyphBegin = box.glyphEnd = static_cast<uint32_t>(glyphs.size());
      chars.push_back(box);
    }
  }

  // Shapes code points [begin, end) of a span, none of which is a newline.
  // Glyphs go to the first code point of their cluster; a ligature's
  // advance is split evenly over the code points it covers.
  void shapePiece(ResolvedSpan const& span, std::vector<Utf8Codepoint> const& cps,
                  size_t begin, size_t end, float scale) {
    Typography const& typography = span.attributes.typography;
    size_t byteStart = cps[begin].byteOffset;
    size_t byteEnd = cps[end - 1].byteOffset + cps[end - 1].byteLength;
    std::string_view text = std::string_view(span.text).substr(byteStart, byteEnd - byteStart);

    std::shared_ptr<TextRun> fontRun;
    if (typography.family != BitmapFontFamily) {
      fontRun = registry.layoutText(text, typography, scale, true);
    }
    if (!fontRun) {
      shapeBitmap(span, cps, begin, end);
      return;
    }

    LineMetrics metrics{fontRun->baseline, fontRun->descent, fontRun->height};
    size_t count = end - begin;
    std::vector<std::vector<size_t>> owned(count);
    std::vector<float> penBefore(fontRun->glyphs.size(), 0.0f);
    float pen = 0.0f;
    auto first = cps.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = cps.begin() + static_cast<std::ptrdiff_t>(end);
    for (size_t g = 0; g < fontRun->glyphs.size(); ++g) {
      penBefore[g] = pen;
      pen += fontRun->glyphs[g].advance;
      size_t offset = byteStart + fontRun->glyphs[g].cluster;
      auto it = std::upper_bound(first, last, offset, [](size_t value, Utf8Codepoint const& cp) {
        return value < cp.byteOffset;
      });
      size_t k = it == first ? 0u : static_cast<size_t>(it - first) - 1u;
      owned[k].push_back(g);
    }

    size_t k = 0;
    while (k < count) {
      size_t groupEnd = k + 1;
      while (groupEnd < count && owned[groupEnd].empty()) ++groupEnd;

      float groupPen = owned[k].empty() ? 0.0f : penBefore[owned[k].front()];
      float groupAdvance = 0.0f;
      uint32_t glyphBegin = static_cast<uint32_t>(glyphs.size());
      for (size_t g : owned[k]) {
        GlyphPlacement const& placement = fontRun->glyphs[g];
        groupAdvance += placement.advance;
        glyphs.push_back(ShapedGlyph{placement.bitmap, placement.x - groupPen, placement.y});
      }
      uint32_t glyphEnd = static_cast<uint32_t>(glyphs.size());

      float share = groupAdvance / static_cast<float>(groupEnd - k);
      for (size_t j = k; j < groupEnd; ++j) {
        CharBox box;
        box.codepoint = cps[begin + j].codepoint;
        box.color = span.attributes.color;
        box.advance = share;
        box.metrics = metrics;
        box.bitmapFont = false;
        box.glyphBegin = j == k ? glyphBegin : glyphEnd;
        box.glyphEnd = glyphEnd;
        chars.push_back(box);
      }
      k = groupEnd;
    }
  }

  void shape(std::shared_ptr<const StyledTextRun> const& run, float scale) {
    if (shapedRun == run && shapedScale == scale) return;
    shapedRun = run;
    shapedScale = scale;
    chars.clear();
    glyphs.clear();
    linesValid = false;
    if (!run) return;

    for (ResolvedSpan const& span : run->spans()) {
      auto cps = DecodeUtf8(span.text);
      size_t pieceStart = 0;
      for (size_t i = 0; i <= cps.size(); ++i) {
        bool newline = i < cps.size() && cps[i].codepoint == '\n';
        if (i < cps.size() && !newline) continue;
        if (i > pieceStart) shapePiece(span, cps, pieceStart, i, scale);
        if (newline) {
          CharBox box;
          box.codepoint = '\n';
          box.color = span.attributes.color;
          box.metrics = metricsFor(span.attributes.typography, scale);
          box.glyphBegin = box.glyphEnd = static_cast<uint32_t>(glyphs.size());
          chars.push_back(box);
        }
        pieceStart = i + 1;
      }
    }
  }

  void breakLines(float width, int32_t maxLines) {
    lines.clear();
    float limit = std::isnan(width) ? UnboundedWidth : std::max(width, 0.0f);
    auto push_line = [&](size_t begin, size_t end) -> bool {
      Line line;
      line.begin = begin;
      line.end = end;
      lines.push_back(line);
      return maxLines <= 0 || lines.size() < static_cast<size_t>(maxLines);
    };

    size_t lineStart = 0;
    size_t breakAt = NoBreak;
    float x = 0.0f;
    bool full = false;
    for (size_t i = 0; i < chars.size(); ++i) {
      CharBox& c = chars[i];
      if (c.codepoint == '\n') {
        c.x = x;
        if (!push_line(lineStart, i + 1)) {
          full = true;
          break;
        }
        lineStart = i + 1;
        breakAt = NoBreak;
        x = 0.0f;
        continue;
      }
      if (!is_break_space(c.codepoint) && i > lineStart && x + c.advance > limit + WrapEpsilon) {
        size_t cut = (breakAt != NoBreak && breakAt > lineStart) ? breakAt : i;
        if (!push_line(lineStart, cut)) {
          full = true;
          break;
        }
        lineStart = cut;
        breakAt = NoBreak;
        x = 0.0f;
        for (size_t j = cut; j < i; ++j) {
          chars[j].x = x;
          x += chars[j].advance;
        }
      }
      c.x = x;
      x += c.advance;
      if (is_break_space(c.codepoint)) breakAt = i + 1;
    }
    if (!full && lineStart < chars.size()) push_line(lineStart, chars.size());

    float top = 0.0f;
    float maxWidth = 0.0f;
    for (Line& line : lines) {
      for (size_t j = line.begin; j < line.end; ++j) {
        CharBox const& c = chars[j];
        line.baseline = std::max(line.baseline, c.metrics.ascent);
        line.height = std::max(line.height, c.metrics.lineHeight);
        if (c.codepoint != '\n' && !is_break_space(c.codepoint)) {
          line.width = std::max(line.width, c.x + c.advance);
        }
      }
      line.top = top;
      top += line.height;
      maxWidth = std::max(maxWidth, line.width);
    }
    used = Size{maxWidth, top};
  }

  void layout(TextStorage const& storage, float width, int32_t maxLines, float scale) {
    shape(storage.run(), scale);
    if (linesValid && lineWidth == width && lineLimit == maxLines) return;
    breakLines(width, maxLines);
    lineWidth = width;
    lineLimit = maxLines;
    linesValid = true;
    ++layouts;
  }

  void draw(Bitmap& bitmap, float scale) const {
    for (Line const& line : lines) {
      float baselineY = line.top + line.baseline;
      for (size_t j = line.begin; j < line.end; ++j) {
        CharBox const& c = chars[j];
        if (c.codepoint == '\n' || is_break_space(c.codepoint)) continue;
        if (c.bitmapFont) {
          float s = c.fontScale;
          float glyphTop = baselineY - c.metrics.ascent;
          for (int py = 0; py < UiFontHeight; ++py) {
            for (int px = 0; px < UiFontWidth; ++px) {
              if (!UiFontPixel(static_cast<char32_t>(c.codepoint), px, py)) continue;
              fill_rect(bitmap,
                        std::lround((c.x + static_cast<float>(px) * s) * scale),
                        std::lround((glyphTop + static_cast<float>(py) * s) * scale),
                        std::lround((c.x + static_cast<float>(px + 1) * s) * scale),
                        std::lround((glyphTop + static_cast<float>(py + 1) * s) * scale),
                        c.color);
            }
          }
          continue;
        }
        for (uint32_t g = c.glyphBegin; g < c.glyphEnd; ++g) {
          ShapedGlyph const& glyph = glyphs[g];
          if (!glyph.bitmap) continue;
          long originX = std::lround((c.x + glyph.dx) * scale) + glyph.bitmap->bearingX;
          long originY = std::lround((baselineY + glyph.dy) * scale) - glyph.bitmap->bearingY;
          blit_glyph(bitmap, *glyph.bitmap, originX, originY, c.color);
        }
      }
    }
  }
};

GlyphLayoutEngine::GlyphLayoutEngine(FontRegistry& registry) : impl(std::make_unique<Impl>(registry)) {}

GlyphLayoutEngine::~GlyphLayoutEngine() = default;

auto GlyphLayoutEngine::measure(TextContainer& container,
                                TextStorage const& storage,
                                float width,
                                float scale) -> Size {
  float s = sanitize_scale(scale);
  impl->layout(storage, width, container.maximumNumberOfLines, s);
  Size size = impl->used.snapped(s);
  container.size = size;
  container.layoutWidth = width;
  return size;
}

auto GlyphLayoutEngine::rasterize(TextContainer const& container,
                                  TextStorage const& storage,
                                  Size size,
                                  float scale,
                                  std::optional<Color> backgroundColor) -> std::shared_ptr<const Bitmap> {
  if (size.empty()) return nullptr;
  float s = sanitize_scale(scale);
  impl->layout(storage, container.layoutWidth, container.maximumNumberOfLines, s);

  auto bitmap = std::make_shared<Bitmap>();
  bitmap->width = static_cast<uint32_t>(std::ceil(size.width * s - WrapEpsilon));
  bitmap->height = static_cast<uint32_t>(std::ceil(size.height * s - WrapEpsilon));
  if (bitmap->width == 0 || bitmap->height == 0) return nullptr;
  bitmap->strideBytes = bitmap->width * 4u;
  bitmap->scale = s;
  bitmap->pixels.assign(static_cast<size_t>(bitmap->strideBytes) * bitmap->height, 0u);
  if (backgroundColor) {
    Color bg = *backgroundColor;
    for (size_t i = 0; i < bitmap->pixels.size(); i += 4) {
      bitmap->pixels[i + 0] = bg.r;
      bitmap->pixels[i + 1] = bg.g;
      bitmap->pixels[i + 2] = bg.b;
      bitmap->pixels[i + 3] = bg.a;
    }
  }
  impl->draw(*bitmap, s);
  return bitmap;
}

auto GlyphLayoutEngine::characterIndex(TextContainer const& container,
                                       TextStorage const& storage,
                                       Point point,
                                       float scale) -> CharacterHit {
  impl->layout(storage, container.layoutWidth, container.maximumNumberOfLines, sanitize_scale(scale));
  auto const& lines = impl->lines;
  auto const& chars = impl->chars;
  if (lines.empty()) return CharacterHit{};

  Line const* line = &lines.back();
  for (Line const& candidate : lines) {
    if (point.y < candidate.top + candidate.height) {
      line = &candidate;
      break;
    }
  }

  size_t end = line->end;
  if (end > line->begin && chars[end - 1].codepoint == '\n') --end;
  if (end == line->begin) return CharacterHit{line->begin, 1.0f};

  if (point.x <= chars[line->begin].x) return CharacterHit{line->begin, 0.0f};
  for (size_t j = line->begin; j < end; ++j) {
    CharBox const& c = chars[j];
    if (point.x < c.x + c.advance) {
      float fraction = c.advance > 0.0f ? (point.x - c.x) / c.advance : 0.0f;
      return CharacterHit{j, std::clamp(fraction, 0.0f, 1.0f)};
    }
  }
  return CharacterHit{end - 1, 1.0f};
}

auto GlyphLayoutEngine::cacheIdentity() const -> uint64_t {
  uint64_t h = Fnv1aMix(Fnv1aOffset, reinterpret_cast<uintptr_t>(&impl->registry));
  return Fnv1aMix(h, impl->registry.generation());
}

auto GlyphLayoutEngine::layoutCount() const -> uint64_t {
  return impl->layouts;
}

} // namespace StyledText
