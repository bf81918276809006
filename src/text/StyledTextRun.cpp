#include "StyledText/text/StyledTextRun.hpp"
#include "StyledText/util/Hash.hpp"
#include "StyledText/util/Utf8.hpp"

#include <algorithm>

namespace StyledText {

namespace {

auto hash_typography(uint64_t h, Typography const& t) -> uint64_t {
  h = HashString(h, t.family);
  h = HashFloat(h, t.size);
  h = Fnv1aMix(h, t.weight);
  h = Fnv1aMix(h, static_cast<uint64_t>(t.slant));
  h = HashFloat(h, t.lineHeight);
  h = HashFloat(h, t.letterSpacing);
  h = HashFloat(h, t.wordSpacing);
  h = HashString(h, t.features);
  h = HashString(h, t.locale);
  h = Fnv1aMix(h, static_cast<uint64_t>(t.fallback));
  return h;
}

} // namespace

auto StyledTextRun::Make(std::vector<ResolvedSpan> spans) -> std::shared_ptr<const StyledTextRun> {
  std::shared_ptr<StyledTextRun> run(new StyledTextRun());
  uint64_t h = Fnv1aOffset;
  size_t cursor = 0;
  for (auto& span : spans) {
    if (span.text.empty()) continue;
    span.characterStart = cursor;
    span.characterCount = CountCodepoints(span.text);
    cursor += span.characterCount;

    h = HashString(h, span.text);
    h = hash_typography(h, span.attributes.typography);
    h = Fnv1aMix(h, PackRGBA8(span.attributes.color));
    h = Fnv1aMix(h, span.attributes.custom.size());
    for (auto const& [key, value] : span.attributes.custom) {
      h = HashString(h, key);
      h = HashString(h, value);
    }
    run->spans_.push_back(std::move(span));
  }
  run->characterCount_ = cursor;
  run->contentHash_ = Fnv1aMix(h, run->spans_.size());
  return run;
}

auto StyledTextRun::spanAt(size_t characterIndex) const -> ResolvedSpan const* {
  if (characterIndex >= characterCount_) return nullptr;
  auto it = std::upper_bound(spans_.begin(), spans_.end(), characterIndex,
                             [](size_t index, ResolvedSpan const& span) { return index < span.characterStart; });
  if (it == spans_.begin()) return nullptr;
  --it;
  if (characterIndex >= it->characterStart + it->characterCount) return nullptr;
  return &*it;
}

bool StyledTextRun::operator==(StyledTextRun const& other) const {
  if (this == &other) return true;
  if (contentHash_ != other.contentHash_ || characterCount_ != other.characterCount_) return false;
  if (spans_.size() != other.spans_.size()) return false;
  for (size_t i = 0; i < spans_.size(); ++i) {
    if (spans_[i].text != other.spans_[i].text) return false;
    if (!(spans_[i].attributes == other.spans_[i].attributes)) return false;
  }
  return true;
}

} // namespace StyledText
