#include "StyledText/render/StyledTextRenderer.hpp"
#include "StyledText/text/FontRegistry.hpp"
#include "StyledText/text/StyledString.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <utility>
#include <string>
#include <vector>

namespace StyledTextDemo {

using namespace StyledText;

bool write_ppm(std::string const& path, Bitmap const& bitmap) {
  if (path.empty() || bitmap.width == 0 || bitmap.height == 0 || bitmap.strideBytes == 0) return false;
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out << "P6\n" << bitmap.width << " " << bitmap.height << "\n255\n";
  for (uint32_t y = 0; y < bitmap.height; ++y) {
    auto const* row = bitmap.pixels.data() + static_cast<size_t>(y) * bitmap.strideBytes;
    for (uint32_t x = 0; x < bitmap.width; ++x) {
      size_t idx = static_cast<size_t>(x) * 4u;
      out.put(static_cast<char>(row[idx + 0]));
      out.put(static_cast<char>(row[idx + 1]));
      out.put(static_cast<char>(row[idx + 2]));
    }
  }
  return static_cast<bool>(out);
}

auto build_message(std::string const& family) -> std::shared_ptr<const StyledTextString> {
  TextStyle base;
  base.typography.family = family;
  base.typography.size = 15.0f;
  base.color = Color{238, 238, 238, 255};

  return StyledTextBuilder(base)
      .save()
      .setSize(22.0f)
      .setWeight(700)
      .setColor(Color{234, 196, 53, 255})
      .add("Styled text\n")
      .restore()
      .add("Measured once, cached by width, category and background. ")
      .save()
      .setColor(Color{139, 173, 255, 255})
      .setAttribute("link", "https://example.com/styled-text")
      .add("Tap this link")
      .restore()
      .add(" to see hit testing pick up custom attributes.")
      .build();
}

} // namespace StyledTextDemo

int main(int argc, char** argv) {
  using namespace StyledText;
  using namespace StyledTextDemo;

  std::string outPath = "styled_text_demo.ppm";
  std::vector<std::string> fontDirs;
  std::string family = "default";
  float width = 320.0f;
  float scale = DefaultScreenScale;
  ContentSizeCategory category = ContentSizeCategory::Large;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--font-dir" && i + 1 < argc) {
      fontDirs.emplace_back(argv[++i]);
    } else if (arg == "--out" && i + 1 < argc) {
      outPath = argv[++i];
    } else if (arg == "--width" && i + 1 < argc) {
      width = static_cast<float>(std::max(1, std::atoi(argv[++i])));
    } else if (arg == "--scale" && i + 1 < argc) {
      scale = static_cast<float>(std::max(1, std::atoi(argv[++i])));
    } else if (arg == "--family" && i + 1 < argc) {
      family = argv[++i];
    } else if (arg == "--category" && i + 1 < argc) {
      if (!ContentSizeCategoryFromName(argv[++i], category)) {
        std::cerr << "unknown category '" << argv[i] << "'\n";
        return 1;
      }
    } else if (arg == "--verbose") {
      spdlog::set_level(spdlog::level::debug);
    }
  }

  auto& registry = GetFontRegistry();
  for (auto const& dir : fontDirs) {
    registry.addBundleDir(dir);
    registry.addOsFallbackDir(dir);
  }
  registry.loadBundledFonts();
  registry.loadOsFallbackFonts();

  RendererOptions options;
  options.inset = EdgeInsets{12.0f, 16.0f, 12.0f, 16.0f};
  options.backgroundColor = Color{18, 22, 30, 255};
  options.scale = scale;
  StyledTextRenderer renderer(build_message(family), category, std::move(options));

  renderer.warm(width);
  RenderResult result = renderer.render(width);
  Size view = renderer.viewSize(width);
  std::cout << "Category: " << ToString(category) << "\n";
  std::cout << "Text size: " << result.size.width << "x" << result.size.height << "\n";
  std::cout << "View size: " << view.width << "x" << view.height << "\n";

  if (!result.bitmap) {
    std::cerr << "nothing to render\n";
    return 1;
  }
  if (!write_ppm(outPath, *result.bitmap)) {
    std::cerr << "failed to write " << outPath << "\n";
    return 1;
  }
  std::cout << "Wrote " << outPath << " (" << result.bitmap->width << "x" << result.bitmap->height << ")\n";

  for (float y = 0.0f; y < result.size.height; y += 4.0f) {
    for (float x = 0.0f; x < result.size.width; x += 4.0f) {
      auto hit = renderer.attributes(Point{x, y});
      if (!hit) continue;
      auto link = hit->attributes.custom.find("link");
      if (link == hit->attributes.custom.end()) continue;
      std::cout << "Link at (" << x << ", " << y << ") index " << hit->index << ": " << link->second << "\n";
      x = result.size.width;
      y = result.size.height;
    }
  }

  auto sizes = renderer.sizeCache()->stats();
  auto bitmaps = renderer.bitmapCache()->stats();
  std::cout << "Size cache: " << sizes.count << " entries, " << sizes.hits << " hits, " << sizes.misses
            << " misses\n";
  std::cout << "Bitmap cache: " << bitmaps.totalCost << " of " << bitmaps.maxCost << " bytes, " << bitmaps.hits
            << " hits, " << bitmaps.misses << " misses\n";
  return 0;
}
