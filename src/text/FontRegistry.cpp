#include "StyledText/text/FontRegistry.hpp"

#include "StyledText/util/Hash.hpp"
#include "StyledText/util/Utf8.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H
#include FT_TRUETYPE_TABLES_H
#include <hb.h>
#include <hb-ft.h>
#endif

namespace StyledText {

#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
namespace {

struct FontFace {
  uint32_t id = 0;
  std::string family;
  uint16_t weight = 400;
  FontSlant slant = FontSlant::Upright;
  FT_Face face = nullptr;
  hb_font_t* hbFont = nullptr;
  bool fromBundle = false;
};

struct GlyphKey {
  uint32_t faceId = 0;
  uint16_t sizePx = 0;
  uint16_t embolden = 0;
  uint32_t glyphId = 0;

  bool operator==(GlyphKey const& other) const = default;
};

struct GlyphKeyHash {
  size_t operator()(GlyphKey const& key) const {
    uint64_t h = Fnv1aOffset;
    h = Fnv1aMix(h, key.faceId);
    h = Fnv1aMix(h, key.sizePx);
    h = Fnv1aMix(h, key.embolden);
    h = Fnv1aMix(h, key.glyphId);
    return static_cast<size_t>(h);
  }
};

auto to_lower(std::string_view text) -> std::string {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Outline emboldening in 26.6 units when the face is lighter than requested.
auto compute_synthetic_bold(uint16_t faceWeight, uint16_t targetWeight, uint16_t sizePx) -> uint16_t {
  if (sizePx == 0u || targetWeight <= faceWeight) return 0u;
  constexpr float EmboldenScale = 0.04f;
  constexpr float EmboldenMinPx = 0.25f;
  constexpr float EmboldenMaxPx = 1.5f;
  float weightScale = std::min<float>(static_cast<float>(targetWeight - faceWeight), 300.0f) / 300.0f;
  float strength = static_cast<float>(sizePx) * EmboldenScale * weightScale;
  if (strength < EmboldenMinPx) return 0u;
  return static_cast<uint16_t>(std::lround(std::min(strength, EmboldenMaxPx) * 64.0f));
}

auto resolve_face_weight(FT_Face face) -> uint16_t {
  if (auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, ft_sfnt_os2)); os2 && os2->usWeightClass != 0) {
    return static_cast<uint16_t>(std::clamp<uint32_t>(os2->usWeightClass, 1u, 1000u));
  }
  return (face->style_flags & FT_STYLE_FLAG_BOLD) ? 700 : 400;
}

auto infer_weight_from_style(std::string_view style) -> std::optional<uint16_t> {
  if (style.empty()) return std::nullopt;
  auto lowered = to_lower(style);
  auto has = [&](std::string_view needle) { return lowered.find(needle) != std::string::npos; };

  if (has("thin")) return 100;
  if (has("extralight") || has("ultralight")) return 200;
  if (has("light")) return 300;
  if (has("regular") || has("normal") || has("book")) return 400;
  if (has("medium")) return 500;
  if (has("semibold") || has("demibold")) return 600;
  if (has("extrabold") || has("ultrabold")) return 800;
  if (has("black") || has("heavy")) return 900;
  if (has("bold")) return 700;
  return std::nullopt;
}

auto is_word_space(uint32_t codepoint) -> bool {
  switch (codepoint) {
    case 0x20u:
    case 0xA0u:
    case 0x2002u:
    case 0x2003u:
    case 0x2009u:
    case 0x200Au:
      return true;
    default:
      return false;
  }
}

void collect_font_files(std::filesystem::path const& root, std::vector<std::string>& out) {
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) return;
  for (auto const& entry : std::filesystem::recursive_directory_iterator(root, ec)) {
    if (ec) break;
    if (!entry.is_regular_file()) continue;
    auto ext = to_lower(entry.path().extension().string());
    if (ext == ".ttf" || ext == ".otf" || ext == ".ttc" || ext == ".otc") {
      out.push_back(entry.path().string());
    }
  }
}

auto parse_features(std::string const& features) -> std::vector<hb_feature_t> {
  std::vector<hb_feature_t> out;
  size_t start = 0;
  while (start < features.size()) {
    size_t end = features.find(',', start);
    if (end == std::string::npos) end = features.size();
    hb_feature_t feature;
    if (hb_feature_from_string(features.data() + start, static_cast<int>(end - start), &feature)) {
      out.push_back(feature);
    }
    start = end + 1;
  }
  return out;
}

bool face_supports_glyph(FontFace const* face, uint32_t codepoint) {
  return face && face->face && FT_Get_Char_Index(face->face, codepoint) != 0;
}

void select_unicode_charmap(FT_Face face) {
  if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) == 0) return;
  for (int i = 0; i < face->num_charmaps; ++i) {
    if (face->charmaps[i] && face->charmaps[i]->encoding == FT_ENCODING_UNICODE) {
      FT_Set_Charmap(face, face->charmaps[i]);
      return;
    }
  }
}

// Bitmap-only faces (color emoji) pick the closest fixed strike.
auto set_face_pixel_size(FT_Face face, uint16_t sizePx) -> uint16_t {
  if (!face || sizePx == 0) return 0;
  if (FT_Set_Pixel_Sizes(face, 0, sizePx) == 0) return sizePx;
  if (face->num_fixed_sizes <= 0) return 0;

  int bestIndex = -1;
  int bestDiff = std::numeric_limits<int>::max();
  int bestSize = 0;
  for (int i = 0; i < face->num_fixed_sizes; ++i) {
    FT_Bitmap_Size size = face->available_sizes[i];
    int yPpem = size.y_ppem > 0 ? static_cast<int>(size.y_ppem / 64) : size.height;
    int diff = std::abs(yPpem - static_cast<int>(sizePx));
    if (diff < bestDiff || (diff == bestDiff && yPpem > bestSize)) {
      bestDiff = diff;
      bestIndex = i;
      bestSize = yPpem;
    }
  }
  if (bestIndex < 0 || FT_Select_Size(face, bestIndex) != 0) return 0;
  return static_cast<uint16_t>(bestSize > 0 ? bestSize : sizePx);
}

// Expands gray or mono FreeType output into one coverage byte per pixel.
bool copy_coverage(FT_Bitmap const& bm, std::vector<uint8_t>& out) {
  int32_t width = static_cast<int32_t>(bm.width);
  int32_t height = static_cast<int32_t>(bm.rows);
  if (!bm.buffer || width <= 0 || height <= 0 || bm.pitch == 0) return false;
  out.assign(static_cast<size_t>(width) * height, 0);
  for (int32_t y = 0; y < height; ++y) {
    int32_t srcRow = bm.pitch > 0 ? y : height - 1 - y;
    uint8_t const* src = bm.buffer + static_cast<ptrdiff_t>(srcRow) * std::abs(bm.pitch);
    uint8_t* dst = out.data() + static_cast<size_t>(y) * width;
    if (bm.pixel_mode == FT_PIXEL_MODE_MONO) {
      for (int32_t x = 0; x < width; ++x) {
        dst[x] = (src[x / 8] & (0x80u >> (x % 8))) ? 255u : 0u;
      }
    } else if (bm.pixel_mode == FT_PIXEL_MODE_GRAY) {
      std::memcpy(dst, src, static_cast<size_t>(width));
    } else {
      return false;
    }
  }
  return true;
}

} // namespace

struct FontRegistry::Impl {
  FT_Library ftLibrary = nullptr;
  uint32_t nextFaceId = 1;
  std::vector<std::unique_ptr<FontFace>> faces;
  std::vector<FontFace*> bundledFaces;
  std::vector<FontFace*> osFaces;
  std::unordered_map<GlyphKey, std::unique_ptr<GlyphBitmap>, GlyphKeyHash> glyphCache;
  std::unordered_map<uint64_t, FontFace*> fallbackCache;
  std::vector<std::shared_ptr<GlyphAtlas>> atlases;
  std::vector<std::string> bundleDirs;
  std::vector<std::string> osFontDirs;
  std::vector<std::string> osFontFiles;
  size_t osFontNext = 0;
  bool bundlesLoaded = false;
  bool osFilesListed = false;
  std::optional<size_t> atlasMax;
  uint64_t generation = 0;
  mutable std::mutex mutex;

  static constexpr int AtlasWidth = 1024;
  static constexpr int AtlasHeight = 1024;

  Impl() {
    if (FT_Init_FreeType(&ftLibrary) != 0) {
      spdlog::warn("FontRegistry: FreeType initialization failed, text falls back to the bitmap font");
      ftLibrary = nullptr;
    }
  }

  ~Impl() {
    for (auto& face : faces) {
      if (face->hbFont) hb_font_destroy(face->hbFont);
      if (face->face) FT_Done_Face(face->face);
    }
    if (ftLibrary) FT_Done_FreeType(ftLibrary);
  }

  void loadFaceFile(std::string const& path, bool fromBundle) {
    if (!ftLibrary) return;
    FT_Face probe = nullptr;
    if (FT_New_Face(ftLibrary, path.c_str(), 0, &probe) != 0 || !probe) {
      spdlog::warn("FontRegistry: cannot open font file '{}'", path);
      return;
    }
    int faceCount = std::max<int>(1, static_cast<int>(probe->num_faces));
    FT_Done_Face(probe);

    for (int idx = 0; idx < faceCount; ++idx) {
      FT_Face f = nullptr;
      if (FT_New_Face(ftLibrary, path.c_str(), idx, &f) != 0 || !f) {
        spdlog::warn("FontRegistry: cannot open face {} of '{}'", idx, path);
        continue;
      }
      select_unicode_charmap(f);
      auto entry = std::make_unique<FontFace>();
      entry->id = nextFaceId++;
      entry->family = f->family_name ? f->family_name : "";
      entry->weight = resolve_face_weight(f);
      if (auto styleWeight = infer_weight_from_style(f->style_name ? f->style_name : "")) {
        if (entry->weight == 400 ||
            std::abs(static_cast<int>(entry->weight) - static_cast<int>(*styleWeight)) >= 100) {
          entry->weight = *styleWeight;
        }
      }
      entry->slant = (f->style_flags & FT_STYLE_FLAG_ITALIC) ? FontSlant::Italic : FontSlant::Upright;
      entry->face = f;
      entry->hbFont = hb_ft_font_create_referenced(f);
      entry->fromBundle = fromBundle;

      FontFace* ptr = entry.get();
      faces.push_back(std::move(entry));
      (fromBundle ? bundledFaces : osFaces).push_back(ptr);
    }
  }

  void loadBundledFonts() {
    if (bundlesLoaded || bundleDirs.empty()) return;
    for (auto const& dir : bundleDirs) {
      std::vector<std::string> files;
      collect_font_files(dir, files);
      std::sort(files.begin(), files.end());
      for (auto const& file : files) {
        loadFaceFile(file, /*fromBundle=*/true);
      }
    }
    bundlesLoaded = true;
    spdlog::info("FontRegistry: loaded {} bundled faces from {} directories", bundledFaces.size(), bundleDirs.size());
  }

  // Lists OS font files once; faces are opened lazily as fallback needs them.
  void loadOsFallbackFonts() {
    if (osFilesListed || osFontDirs.empty()) return;
    osFilesListed = true;
    for (auto const& dir : osFontDirs) {
      collect_font_files(dir, osFontFiles);
    }
    std::sort(osFontFiles.begin(), osFontFiles.end());
  }

  FontFace* loadNextOsFallbackFace() {
    loadOsFallbackFonts();
    while (osFontNext < osFontFiles.size()) {
      size_t before = osFaces.size();
      loadFaceFile(osFontFiles[osFontNext++], /*fromBundle=*/false);
      if (osFaces.size() > before) return osFaces.back();
    }
    return nullptr;
  }

  FontFace* selectPrimaryFace(Typography const& typography) {
    loadBundledFonts();
    std::string target = to_lower(typography.family);
    if (target == BitmapFontFamily) return nullptr;
    bool anyFamily = target.empty() || target == "default";

    auto pick_best = [&](std::vector<FontFace*> const& candidates) -> FontFace* {
      FontFace* best = nullptr;
      int bestScore = std::numeric_limits<int>::max();
      for (auto* face : candidates) {
        if (!anyFamily && to_lower(face->family) != target) continue;
        int score = std::abs(static_cast<int>(face->weight) - static_cast<int>(typography.weight));
        if (face->slant != typography.slant) score += 500;
        if (score < bestScore) {
          bestScore = score;
          best = face;
        }
      }
      return best;
    };

    if (anyFamily && !bundledFaces.empty()) return bundledFaces.front();
    if (auto* best = pick_best(bundledFaces)) return best;
    if (typography.fallback == FontFallbackPolicy::BundleThenOS) {
      while (true) {
        if (auto* best = pick_best(osFaces)) return best;
        if (!loadNextOsFallbackFace()) break;
      }
    }
    if (!bundledFaces.empty()) return bundledFaces.front();
    if (!osFaces.empty()) return osFaces.front();
    return nullptr;
  }

  FontFace* resolveFaceForCodepoint(uint32_t codepoint, FontFace* primary, FontFallbackPolicy policy) {
    if (face_supports_glyph(primary, codepoint)) return primary;

    uint64_t cacheKey = (static_cast<uint64_t>(primary ? primary->id : 0) << 32) | codepoint;
    if (auto it = fallbackCache.find(cacheKey); it != fallbackCache.end()) return it->second;

    auto remember = [&](FontFace* face) {
      fallbackCache[cacheKey] = face;
      return face;
    };

    for (auto* face : bundledFaces) {
      if (face != primary && face_supports_glyph(face, codepoint)) return remember(face);
    }
    if (policy == FontFallbackPolicy::BundleOnly) return remember(primary);

    while (true) {
      for (auto* face : osFaces) {
        if (face_supports_glyph(face, codepoint)) return remember(face);
      }
      if (!loadNextOsFallbackFace()) break;
    }
    return remember(primary);
  }

  size_t resolveAtlasMax() {
    if (atlasMax) return *atlasMax;
    atlasMax = 0;
    if (auto env = std::getenv("STYLEDTEXT_FONT_ATLAS_MAX")) {
      char* end = nullptr;
      unsigned long value = std::strtoul(env, &end, 10);
      if (end != env && value > 0) {
        atlasMax = static_cast<size_t>(value);
      } else {
        spdlog::warn("FontRegistry: ignoring STYLEDTEXT_FONT_ATLAS_MAX='{}'", env);
      }
    }
    return *atlasMax;
  }

  // Shelf packing into 1024x1024 pages; returns nullptr when the glyph is
  // too large or the page limit is reached.
  std::shared_ptr<GlyphAtlas> allocateAtlasSlot(int width, int height, int& outX, int& outY) {
    if (width <= 0 || height <= 0 || width > AtlasWidth || height > AtlasHeight) return nullptr;

    auto try_allocate = [&](GlyphAtlas& atlas) -> bool {
      if (atlas.cursorX + width > atlas.width) {
        atlas.cursorX = 0;
        atlas.cursorY += atlas.rowHeight;
        atlas.rowHeight = 0;
      }
      if (atlas.cursorY + height > atlas.height) return false;
      outX = atlas.cursorX;
      outY = atlas.cursorY;
      atlas.cursorX += width;
      atlas.rowHeight = std::max(atlas.rowHeight, height);
      return true;
    };

    for (auto const& atlas : atlases) {
      if (try_allocate(*atlas)) return atlas;
    }
    size_t maxAtlases = resolveAtlasMax();
    if (maxAtlases > 0 && atlases.size() >= maxAtlases) return nullptr;

    auto atlas = std::make_shared<GlyphAtlas>();
    atlas->width = AtlasWidth;
    atlas->height = AtlasHeight;
    atlas->stride = AtlasWidth;
    atlas->pixels.assign(static_cast<size_t>(AtlasWidth) * AtlasHeight, 0);
    if (!try_allocate(*atlas)) return nullptr;
    atlases.push_back(atlas);
    return atlas;
  }

  GlyphBitmap* getGlyphBitmap(FontFace* face, uint32_t glyphId, uint16_t sizePx, uint16_t emboldenStrength) {
    if (!face || !face->face || sizePx == 0) return nullptr;
    GlyphKey key{face->id, sizePx, emboldenStrength, glyphId};
    if (auto it = glyphCache.find(key); it != glyphCache.end()) return it->second.get();

    if (set_face_pixel_size(face->face, sizePx) == 0) return nullptr;
    if (FT_Load_Glyph(face->face, glyphId, FT_LOAD_DEFAULT | FT_LOAD_COLOR) != 0) return nullptr;
    FT_GlyphSlot slot = face->face->glyph;
    if (emboldenStrength > 0 && slot->format == FT_GLYPH_FORMAT_OUTLINE) {
      FT_Outline_Embolden(&slot->outline, static_cast<FT_Pos>(emboldenStrength));
    }
    if (slot->format != FT_GLYPH_FORMAT_BITMAP && FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL) != 0) {
      return nullptr;
    }

    FT_Bitmap& bm = slot->bitmap;
    auto bitmap = std::make_unique<GlyphBitmap>();
    bitmap->width = static_cast<int32_t>(bm.width);
    bitmap->height = static_cast<int32_t>(bm.rows);
    bitmap->bearingX = slot->bitmap_left;
    bitmap->bearingY = slot->bitmap_top;
    bitmap->advance = static_cast<int32_t>(slot->advance.x / 64);

    if (bm.buffer && bitmap->width > 0 && bitmap->height > 0) {
      if (bm.pixel_mode == FT_PIXEL_MODE_BGRA) {
        bitmap->format = GlyphBitmapFormat::ColorBGRA;
        bitmap->stride = bitmap->width * 4;
        bitmap->pixels.resize(static_cast<size_t>(bitmap->stride) * bitmap->height);
        for (int32_t y = 0; y < bitmap->height; ++y) {
          int32_t srcRow = bm.pitch >= 0 ? y : bitmap->height - 1 - y;
          std::memcpy(bitmap->pixels.data() + static_cast<size_t>(y) * bitmap->stride,
                      bm.buffer + static_cast<ptrdiff_t>(srcRow) * std::abs(bm.pitch),
                      static_cast<size_t>(bitmap->stride));
        }
      } else {
        std::vector<uint8_t> coverage;
        if (!copy_coverage(bm, coverage)) return nullptr;
        bitmap->format = GlyphBitmapFormat::Mask8;
        int atlasX = 0;
        int atlasY = 0;
        if (auto atlas = allocateAtlasSlot(bitmap->width, bitmap->height, atlasX, atlasY)) {
          bitmap->atlas = atlas;
          bitmap->atlasX = atlasX;
          bitmap->atlasY = atlasY;
          bitmap->stride = atlas->stride;
          for (int32_t y = 0; y < bitmap->height; ++y) {
            std::memcpy(atlas->pixels.data() + static_cast<size_t>(atlasY + y) * atlas->stride + atlasX,
                        coverage.data() + static_cast<size_t>(y) * bitmap->width,
                        static_cast<size_t>(bitmap->width));
          }
        } else {
          bitmap->stride = bitmap->width;
          bitmap->pixels = std::move(coverage);
        }
      }
    }

    GlyphBitmap* out = bitmap.get();
    glyphCache.emplace(key, std::move(bitmap));
    return out;
  }

  std::shared_ptr<TextRun> layoutText(std::string_view text,
                                      Typography const& typography,
                                      float deviceScale,
                                      bool buildGlyphs) {
    float scale = deviceScale > 0.0f ? deviceScale : 1.0f;
    if (text.empty()) {
      auto run = std::make_shared<TextRun>();
      run->layoutScale = scale;
      return run;
    }

    FontFace* primary = selectPrimaryFace(typography);
    if (!primary) return nullptr;

    float invScale = 1.0f / scale;
    uint16_t sizePixels = static_cast<uint16_t>(std::max(1.0f, std::round(typography.size * scale)));

    auto codepoints = DecodeUtf8(text);

    struct Segment {
      FontFace* face;
      size_t startIndex;
      size_t endIndex;
    };
    std::vector<Segment> segments;
    for (size_t i = 0; i < codepoints.size(); ++i) {
      FontFace* face = resolveFaceForCodepoint(codepoints[i].codepoint, primary, typography.fallback);
      if (segments.empty() || segments.back().face != face) {
        segments.push_back(Segment{face, i, i + 1});
      } else {
        segments.back().endIndex = i + 1;
      }
    }

    auto run = std::make_shared<TextRun>();
    run->layoutScale = scale;
    run->contentHash = Fnv1aOffset;

    float penX = 0.0f;
    float maxAscender = 0.0f;
    float minDescender = 0.0f;
    float maxRight = 0.0f;
    float maxEmbolden = 0.0f;
    float letterSpacing = typography.letterSpacing;
    if (std::abs(letterSpacing) <= 1.0f) letterSpacing *= typography.size;
    auto features = parse_features(typography.features);

    for (auto const& seg : segments) {
      if (!seg.face || !seg.face->face) continue;
      uint16_t effectiveSize = set_face_pixel_size(seg.face->face, sizePixels);
      if (effectiveSize == 0) continue;
      if (seg.face->hbFont) {
        hb_ft_font_set_load_flags(seg.face->hbFont, FT_LOAD_DEFAULT);
        hb_ft_font_changed(seg.face->hbFont);
      }
      uint16_t embolden = compute_synthetic_bold(seg.face->weight, typography.weight, effectiveSize);
      maxEmbolden = std::max(maxEmbolden, static_cast<float>(embolden) / 64.0f * invScale);

      size_t startByte = codepoints[seg.startIndex].byteOffset;
      size_t endByte = codepoints[seg.endIndex - 1].byteOffset + codepoints[seg.endIndex - 1].byteLength;
      int length = static_cast<int>(endByte - startByte);

      hb_buffer_t* buffer = hb_buffer_create();
      hb_buffer_add_utf8(buffer, text.data() + startByte, length, 0, length);
      if (!typography.locale.empty()) {
        hb_buffer_set_language(buffer, hb_language_from_string(typography.locale.c_str(), -1));
      }
      hb_buffer_guess_segment_properties(buffer);
      hb_shape(seg.face->hbFont, buffer, features.empty() ? nullptr : features.data(),
               static_cast<unsigned int>(features.size()));

      unsigned int glyphCount = 0;
      hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer, &glyphCount);
      hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer, &glyphCount);

      auto const& metrics = seg.face->face->size->metrics;
      maxAscender = std::max(maxAscender, static_cast<float>(metrics.ascender) / 64.0f * invScale);
      minDescender = std::min(minDescender, static_cast<float>(metrics.descender) / 64.0f * invScale);

      run->contentHash = Fnv1aMix(run->contentHash, embolden);
      for (unsigned int i = 0; i < glyphCount; ++i) {
        float xAdvance = static_cast<float>(positions[i].x_advance) / 64.0f * invScale;
        uint32_t cluster = static_cast<uint32_t>(startByte + infos[i].cluster);

        GlyphPlacement placement;
        placement.glyphId = static_cast<int32_t>(infos[i].codepoint);
        placement.x = penX + static_cast<float>(positions[i].x_offset) / 64.0f * invScale;
        placement.y = -static_cast<float>(positions[i].y_offset) / 64.0f * invScale;
        placement.cluster = cluster;
        if (buildGlyphs) {
          placement.bitmap = getGlyphBitmap(seg.face, infos[i].codepoint, effectiveSize, embolden);
        }

        float glyphRight = placement.x + xAdvance;
        if (placement.bitmap) {
          glyphRight = std::max(glyphRight, placement.x + static_cast<float>(placement.bitmap->bearingX +
                                                                              placement.bitmap->width) * invScale);
        }

        float wordSpacing = 0.0f;
        if (typography.wordSpacing != 0.0f) {
          auto it = std::lower_bound(codepoints.begin(), codepoints.end(), static_cast<size_t>(cluster),
                                     [](Utf8Codepoint const& cp, size_t offset) { return cp.byteOffset < offset; });
          if (it != codepoints.end() && it->byteOffset == cluster && is_word_space(it->codepoint)) {
            wordSpacing = std::abs(typography.wordSpacing) <= 1.0f ? xAdvance * typography.wordSpacing
                                                                  : typography.wordSpacing;
          }
        }
        placement.advance = xAdvance + letterSpacing + wordSpacing;
        penX += placement.advance;
        maxRight = std::max(maxRight, glyphRight);
        run->glyphs.push_back(placement);

        run->contentHash = Fnv1aMix(run->contentHash, seg.face->id);
        run->contentHash = Fnv1aMix(run->contentHash, static_cast<uint64_t>(placement.glyphId));
        run->contentHash = Fnv1aMix(run->contentHash, static_cast<uint64_t>(std::lround(placement.x * 64.0f)));
      }
      hb_buffer_destroy(buffer);
    }

    run->baseline = maxAscender;
    run->descent = -minDescender;
    run->height = maxAscender - minDescender + maxEmbolden;
    run->width = std::max(penX, maxRight) + maxEmbolden;
    if (typography.lineHeight > 0.0f) run->height = typography.lineHeight;
    return run;
  }
};
#else
struct FontRegistry::Impl {
  uint64_t generation = 0;
  mutable std::mutex mutex;
};
#endif

FontRegistry::FontRegistry() : impl(std::make_unique<Impl>()) {}

FontRegistry::~FontRegistry() = default;

void FontRegistry::addBundleDir(std::string dir) {
#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
  if (dir.empty()) return;
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->bundleDirs.push_back(std::move(dir));
  ++impl->generation;
#else
  (void)dir;
#endif
}

void FontRegistry::addOsFallbackDir(std::string dir) {
#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
  if (dir.empty()) return;
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->osFontDirs.push_back(std::move(dir));
  ++impl->generation;
#else
  (void)dir;
#endif
}

void FontRegistry::loadBundledFonts() {
#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->loadBundledFonts();
#endif
}

void FontRegistry::loadOsFallbackFonts() {
#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->loadOsFallbackFonts();
#endif
}

bool FontRegistry::hasBundledFaces() const {
#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
  std::lock_guard<std::mutex> lock(impl->mutex);
  return !impl->bundledFaces.empty();
#else
  return false;
#endif
}

auto FontRegistry::layoutText(std::string_view text,
                              Typography const& typography,
                              float deviceScale,
                              bool buildGlyphs) -> std::shared_ptr<TextRun> {
#if defined(STYLEDTEXT_ENABLE_FONTS) && STYLEDTEXT_ENABLE_FONTS
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->layoutText(text, typography, deviceScale, buildGlyphs);
#else
  (void)typography;
  (void)buildGlyphs;
  if (!text.empty()) return nullptr;
  auto run = std::make_shared<TextRun>();
  run->layoutScale = deviceScale > 0.0f ? deviceScale : 1.0f;
  return run;
#endif
}

auto FontRegistry::generation() const -> uint64_t {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->generation;
}

FontRegistry& GetFontRegistry() {
  static FontRegistry registry;
  return registry;
}

} // namespace StyledText
