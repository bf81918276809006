#include "StyledText/text/StyledString.hpp"

#include <algorithm>
#include <utility>

namespace StyledText {

auto TextStyle::resolved(ContentSizeCategory category) const -> TextAttributes {
  TextAttributes out;
  out.typography = typography;
  out.color = color;
  out.custom = attributes;
  if (scalesWithContentSize) {
    float size = typography.size * ContentSizeMultiplier(category);
    if (maximumSize > 0.0f) size = std::min(size, maximumSize);
    out.typography.size = size;
  }
  return out;
}

StyledTextString::StyledTextString(std::vector<StyledSegment> parts) : parts_(std::move(parts)) {}

auto StyledTextString::allText() const -> std::string {
  std::string out;
  for (auto const& part : parts_) {
    out += part.text;
  }
  return out;
}

bool StyledTextString::empty() const {
  return std::all_of(parts_.begin(), parts_.end(), [](StyledSegment const& part) { return part.text.empty(); });
}

auto StyledTextString::render(ContentSizeCategory category) const -> std::shared_ptr<const StyledTextRun> {
  std::vector<ResolvedSpan> spans;
  spans.reserve(parts_.size());
  for (auto const& part : parts_) {
    if (part.text.empty()) continue;
    TextAttributes attributes = part.style.resolved(category);
    // Neighbouring parts with identical resolved style collapse into one span.
    if (!spans.empty() && spans.back().attributes == attributes) {
      spans.back().text += part.text;
      continue;
    }
    ResolvedSpan span;
    span.text = part.text;
    span.attributes = std::move(attributes);
    spans.push_back(std::move(span));
  }
  return StyledTextRun::Make(std::move(spans));
}

StyledTextBuilder::StyledTextBuilder(TextStyle base) : style_(std::move(base)) {}

auto StyledTextBuilder::add(std::string_view text) -> StyledTextBuilder& {
  return add(text, style_);
}

auto StyledTextBuilder::add(std::string_view text, TextStyle const& style) -> StyledTextBuilder& {
  if (text.empty()) return *this;
  parts_.push_back(StyledSegment{std::string{text}, style});
  return *this;
}

auto StyledTextBuilder::add(StyledTextString const& string) -> StyledTextBuilder& {
  for (auto const& part : string.parts()) {
    add(part.text, part.style);
  }
  return *this;
}

auto StyledTextBuilder::setFamily(std::string family) -> StyledTextBuilder& {
  style_.typography.family = std::move(family);
  return *this;
}

auto StyledTextBuilder::setSize(float size) -> StyledTextBuilder& {
  style_.typography.size = size;
  return *this;
}

auto StyledTextBuilder::setWeight(uint16_t weight) -> StyledTextBuilder& {
  style_.typography.weight = weight;
  return *this;
}

auto StyledTextBuilder::setSlant(FontSlant slant) -> StyledTextBuilder& {
  style_.typography.slant = slant;
  return *this;
}

auto StyledTextBuilder::setColor(Color color) -> StyledTextBuilder& {
  style_.color = color;
  return *this;
}

auto StyledTextBuilder::setScalesWithContentSize(bool scales) -> StyledTextBuilder& {
  style_.scalesWithContentSize = scales;
  return *this;
}

auto StyledTextBuilder::setAttribute(std::string key, std::string value) -> StyledTextBuilder& {
  style_.attributes.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

auto StyledTextBuilder::removeAttribute(std::string_view key) -> StyledTextBuilder& {
  if (auto it = style_.attributes.find(key); it != style_.attributes.end()) {
    style_.attributes.erase(it);
  }
  return *this;
}

auto StyledTextBuilder::save() -> StyledTextBuilder& {
  savedStyles_.push_back(style_);
  return *this;
}

auto StyledTextBuilder::restore() -> StyledTextBuilder& {
  if (savedStyles_.empty()) return *this;
  style_ = std::move(savedStyles_.back());
  savedStyles_.pop_back();
  return *this;
}

auto StyledTextBuilder::clearText() -> StyledTextBuilder& {
  parts_.clear();
  return *this;
}

auto StyledTextBuilder::build() const -> std::shared_ptr<const StyledTextString> {
  return std::make_shared<const StyledTextString>(parts_);
}

} // namespace StyledText
