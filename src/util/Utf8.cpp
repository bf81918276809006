#include "StyledText/util/Utf8.hpp"

namespace StyledText {

namespace {

auto continuation(std::string_view text, size_t at) -> uint32_t {
  return static_cast<unsigned char>(text[at]) & 0x3Fu;
}

auto is_continuation(std::string_view text, size_t at) -> bool {
  return at < text.size() && (static_cast<unsigned char>(text[at]) & 0xC0u) == 0x80u;
}

auto decode_one(std::string_view text, size_t i) -> Utf8Codepoint {
  Utf8Codepoint cp;
  cp.byteOffset = i;
  unsigned char c = static_cast<unsigned char>(text[i]);
  if (c < 0x80) {
    cp.codepoint = c;
    cp.byteLength = 1;
  } else if ((c >> 5) == 0x6 && is_continuation(text, i + 1)) {
    cp.codepoint = ((c & 0x1Fu) << 6) | continuation(text, i + 1);
    cp.byteLength = 2;
  } else if ((c >> 4) == 0xE && is_continuation(text, i + 1) && is_continuation(text, i + 2)) {
    cp.codepoint = ((c & 0x0Fu) << 12) | (continuation(text, i + 1) << 6) | continuation(text, i + 2);
    cp.byteLength = 3;
  } else if ((c >> 3) == 0x1E && is_continuation(text, i + 1) && is_continuation(text, i + 2) &&
             is_continuation(text, i + 3)) {
    cp.codepoint = ((c & 0x07u) << 18) | (continuation(text, i + 1) << 12) |
                   (continuation(text, i + 2) << 6) | continuation(text, i + 3);
    cp.byteLength = 4;
  } else {
    cp.codepoint = 0xFFFD;
    cp.byteLength = 1;
  }
  return cp;
}

} // namespace

auto DecodeUtf8(std::string_view text) -> std::vector<Utf8Codepoint> {
  std::vector<Utf8Codepoint> out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    Utf8Codepoint cp = decode_one(text, i);
    i += cp.byteLength;
    out.push_back(cp);
  }
  return out;
}

auto CountCodepoints(std::string_view text) -> size_t {
  size_t count = 0;
  size_t i = 0;
  while (i < text.size()) {
    i += decode_one(text, i).byteLength;
    ++count;
  }
  return count;
}

} // namespace StyledText
