#pragma once

#include "StyledText/render/Geometry.hpp"
#include "StyledText/text/Typography.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace StyledText {

// Caller-defined attributes such as link targets or mention ids. Ordered so
// the content hash does not depend on insertion order.
using TextAttributeMap = std::map<std::string, std::string, std::less<>>;

struct TextAttributes {
  Typography typography;
  Color color{0, 0, 0, 255};
  TextAttributeMap custom;

  bool operator==(TextAttributes const& other) const = default;
};

struct ResolvedSpan {
  std::string text;
  TextAttributes attributes;
  size_t characterStart = 0;
  size_t characterCount = 0;
};

// Concrete styled text for one content size category. Immutable once
// built; shared between storages and cache keys.
class StyledTextRun {
public:
  static auto Make(std::vector<ResolvedSpan> spans) -> std::shared_ptr<const StyledTextRun>;

  auto spans() const -> std::vector<ResolvedSpan> const& { return spans_; }
  auto contentHash() const -> uint64_t { return contentHash_; }
  auto characterCount() const -> size_t { return characterCount_; }

  // Span covering the code point index, or nullptr when out of range.
  auto spanAt(size_t characterIndex) const -> ResolvedSpan const*;

  bool operator==(StyledTextRun const& other) const;

private:
  StyledTextRun() = default;

  std::vector<ResolvedSpan> spans_;
  uint64_t contentHash_ = 0;
  size_t characterCount_ = 0;
};

} // namespace StyledText
