#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace StyledText {

struct Utf8Codepoint {
  uint32_t codepoint = 0;
  size_t byteOffset = 0;
  size_t byteLength = 0;
};

// Malformed sequences decode to U+FFFD one byte at a time.
auto DecodeUtf8(std::string_view text) -> std::vector<Utf8Codepoint>;
auto CountCodepoints(std::string_view text) -> size_t;

} // namespace StyledText
