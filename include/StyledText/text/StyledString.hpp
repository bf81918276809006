#pragma once

#include "StyledText/render/Geometry.hpp"
#include "StyledText/text/ContentSizeCategory.hpp"
#include "StyledText/text/StyledTextRun.hpp"
#include "StyledText/text/Typography.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace StyledText {

struct TextStyle {
  Typography typography;
  Color color{0, 0, 0, 255};
  // When set, typography.size is multiplied by the content size category.
  bool scalesWithContentSize = true;
  // Upper bound for the scaled size; 0 leaves it unbounded.
  float maximumSize = 0.0f;
  TextAttributeMap attributes;

  bool operator==(TextStyle const& other) const = default;

  auto resolved(ContentSizeCategory category) const -> TextAttributes;
};

struct StyledSegment {
  std::string text;
  TextStyle style;

  bool operator==(StyledSegment const& other) const = default;
};

// Abstract description of styled text, independent of width, pixel scale
// and content size category.
class StyledTextString {
public:
  StyledTextString() = default;
  explicit StyledTextString(std::vector<StyledSegment> parts);

  auto parts() const -> std::vector<StyledSegment> const& { return parts_; }
  auto allText() const -> std::string;
  bool empty() const;

  auto render(ContentSizeCategory category) const -> std::shared_ptr<const StyledTextRun>;

  bool operator==(StyledTextString const& other) const = default;

private:
  std::vector<StyledSegment> parts_;
};

class StyledTextBuilder {
public:
  explicit StyledTextBuilder(TextStyle base = {});

  auto add(std::string_view text) -> StyledTextBuilder&;
  auto add(std::string_view text, TextStyle const& style) -> StyledTextBuilder&;
  auto add(StyledTextString const& string) -> StyledTextBuilder&;

  auto setFamily(std::string family) -> StyledTextBuilder&;
  auto setSize(float size) -> StyledTextBuilder&;
  auto setWeight(uint16_t weight) -> StyledTextBuilder&;
  auto setSlant(FontSlant slant) -> StyledTextBuilder&;
  auto setColor(Color color) -> StyledTextBuilder&;
  auto setScalesWithContentSize(bool scales) -> StyledTextBuilder&;
  auto setAttribute(std::string key, std::string value) -> StyledTextBuilder&;
  auto removeAttribute(std::string_view key) -> StyledTextBuilder&;

  // Pushes the current style; restore() pops it. restore() on an empty
  // stack keeps the current style.
  auto save() -> StyledTextBuilder&;
  auto restore() -> StyledTextBuilder&;
  auto clearText() -> StyledTextBuilder&;

  auto currentStyle() const -> TextStyle const& { return style_; }
  auto build() const -> std::shared_ptr<const StyledTextString>;

private:
  TextStyle style_;
  std::vector<TextStyle> savedStyles_;
  std::vector<StyledSegment> parts_;
};

} // namespace StyledText
