#pragma once

#include <string_view>
#include <utility>

namespace StyledText {

inline constexpr int UiFontWidth = 5;
inline constexpr int UiFontHeight = 7;
inline constexpr int UiFontAdvance = 6;

// Lowercase letters render with the uppercase glyphs; code points outside
// printable ASCII render as a hollow box.
bool UiFontPixel(char32_t c, int x, int y);
auto UiFontScale(float sizePixels) -> float;
auto MeasureUiText(std::string_view text, float sizePixels) -> std::pair<int, int>;

} // namespace StyledText
