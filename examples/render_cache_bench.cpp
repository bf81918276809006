#include "StyledText/render/StyledTextRenderer.hpp"
#include "StyledText/text/StyledString.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace StyledText;

namespace {
struct BenchConfig {
  uint32_t threads = 4;
  uint32_t renderersPerThread = 16;
  uint32_t iterations = 200;
  uint32_t widths = 8;
  uint32_t distinctTexts = 32;
  bool bitmaps = true;
  bool clearEachRound = false;
};

auto parse_u32(char const* s, uint32_t fallback) -> uint32_t {
  if (!s) return fallback;
  char* end = nullptr;
  auto v = std::strtoul(s, &end, 10);
  if (end == s) return fallback;
  return static_cast<uint32_t>(v);
}

auto parse_args(int argc, char** argv) -> BenchConfig {
  BenchConfig cfg;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    auto next = [&](uint32_t fallback) {
      if (i + 1 >= argc) return fallback;
      return parse_u32(argv[++i], fallback);
    };
    if (arg == "--threads") {
      cfg.threads = next(cfg.threads);
    } else if (arg == "--renderers") {
      cfg.renderersPerThread = next(cfg.renderersPerThread);
    } else if (arg == "--iterations") {
      cfg.iterations = next(cfg.iterations);
    } else if (arg == "--widths") {
      cfg.widths = next(cfg.widths);
    } else if (arg == "--texts") {
      cfg.distinctTexts = next(cfg.distinctTexts);
    } else if (arg == "--sizes-only") {
      cfg.bitmaps = false;
    } else if (arg == "--clear") {
      cfg.clearEachRound = true;
    }
  }
  if (cfg.threads == 0) cfg.threads = 1;
  if (cfg.renderersPerThread == 0) cfg.renderersPerThread = 1;
  if (cfg.widths == 0) cfg.widths = 1;
  if (cfg.distinctTexts == 0) cfg.distinctTexts = 1;
  return cfg;
}

auto make_text(uint32_t seed) -> std::shared_ptr<const StyledTextString> {
  TextStyle style;
  style.typography.family = std::string(BitmapFontFamily);
  style.typography.size = 14.0f;
  return StyledTextBuilder(style)
      .add("Message " + std::to_string(seed) + ": ")
      .setColor(Color{40, 90, 200, 255})
      .add("the quick brown fox jumps over the lazy dog")
      .build();
}

} // namespace

int main(int argc, char** argv) {
  BenchConfig cfg = parse_args(argc, argv);

  std::vector<std::shared_ptr<const StyledTextString>> texts;
  for (uint32_t i = 0; i < cfg.distinctTexts; ++i) texts.push_back(make_text(i));

  auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> workers;
  for (uint32_t t = 0; t < cfg.threads; ++t) {
    workers.emplace_back([&cfg, &texts, t] {
      std::vector<std::unique_ptr<StyledTextRenderer>> renderers;
      for (uint32_t r = 0; r < cfg.renderersPerThread; ++r) {
        auto const& text = texts[(t * cfg.renderersPerThread + r) % texts.size()];
        renderers.push_back(std::make_unique<StyledTextRenderer>(text, ContentSizeCategory::Large));
      }
      for (uint32_t it = 0; it < cfg.iterations; ++it) {
        float width = 120.0f + 40.0f * static_cast<float>(it % cfg.widths);
        for (auto& renderer : renderers) {
          if (cfg.bitmaps) {
            renderer->warm(width, WarmOption::Bitmap);
          } else {
            renderer->warm(width);
          }
        }
        if (cfg.clearEachRound && t == 0 && it % 50 == 49) renderers.front()->clearCaches();
      }
    });
  }
  for (auto& worker : workers) worker.join();
  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

  auto sizes = GlobalSizeCache()->stats();
  auto bitmaps = GlobalBitmapCache()->stats();
  uint64_t calls = static_cast<uint64_t>(cfg.threads) * cfg.renderersPerThread * cfg.iterations;

  std::cout << "StyledText render cache bench\n";
  std::cout << "Threads: " << cfg.threads << ", renderers/thread: " << cfg.renderersPerThread
            << ", iterations: " << cfg.iterations << ", widths: " << cfg.widths << "\n";
  std::cout << "Calls: " << calls << " in " << elapsed << " ms";
  if (calls > 0) std::cout << " (" << (elapsed * 1000.0 / static_cast<double>(calls)) << " us/call)";
  std::cout << "\n";
  std::cout << "Size cache: hits " << sizes.hits << ", misses " << sizes.misses << ", evictions " << sizes.evictions
            << ", entries " << sizes.count << "/" << sizes.maxCost << "\n";
  std::cout << "Bitmap cache: hits " << bitmaps.hits << ", misses " << bitmaps.misses << ", evictions "
            << bitmaps.evictions << ", bytes " << bitmaps.totalCost << "/" << bitmaps.maxCost << "\n";
  return 0;
}
