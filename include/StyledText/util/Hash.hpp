#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace StyledText {

inline constexpr uint64_t Fnv1aOffset = 1469598103934665603ull;
inline constexpr uint64_t Fnv1aPrime = 1099511628211ull;

constexpr auto Fnv1aMix(uint64_t h, uint64_t v) -> uint64_t {
  h ^= v;
  h *= Fnv1aPrime;
  return h;
}

constexpr auto HashString(uint64_t h, std::string_view text) -> uint64_t {
  for (char c : text) {
    h = Fnv1aMix(h, static_cast<unsigned char>(c));
  }
  // Length terminates the field so adjacent strings cannot shift into each other.
  return Fnv1aMix(h, text.size());
}

// +0 and -0 compare equal, so they hash equal too.
inline auto HashFloat(uint64_t h, float value) -> uint64_t {
  if (value == 0.0f) value = 0.0f;
  return Fnv1aMix(h, std::bit_cast<uint32_t>(value));
}

} // namespace StyledText
