#include "StyledText/render/TextStorage.hpp"

#include <utility>

namespace StyledText {

TextStorage::TextStorage(std::shared_ptr<const StyledTextRun> run, ContentSizeCategory category)
    : run_(run ? std::move(run) : StyledTextRun::Make({})), category_(category) {}

bool TextStorage::bind(TextLayoutEngine const* engine) {
  if (!engine) return false;
  if (engine_ && engine_ != engine) return false;
  engine_ = engine;
  return true;
}

} // namespace StyledText
