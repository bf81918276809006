#pragma once

#include "StyledText/text/TextLayout.hpp"
#include "StyledText/text/Typography.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace StyledText {

// Owns the FreeType library, loaded faces and the glyph bitmap cache. All
// public calls are serialized on an internal mutex.
class FontRegistry {
public:
  FontRegistry();
  ~FontRegistry();

  FontRegistry(FontRegistry const&) = delete;
  FontRegistry& operator=(FontRegistry const&) = delete;

  void addBundleDir(std::string dir);
  void addOsFallbackDir(std::string dir);
  void loadBundledFonts();
  void loadOsFallbackFonts();
  bool hasBundledFaces() const;

  // Shapes one line of text. Returns nullptr when no face resolves, which
  // callers treat as "use the bitmap font". Glyph bitmaps stay owned by the
  // registry and live as long as it does.
  auto layoutText(std::string_view text,
                  Typography const& typography,
                  float deviceScale,
                  bool buildGlyphs = true) -> std::shared_ptr<TextRun>;

  // Bumped whenever the set of usable faces changes (new directories,
  // bundle or fallback loading). Layout results depend on it.
  auto generation() const -> uint64_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};

auto GetFontRegistry() -> FontRegistry&;

} // namespace StyledText
