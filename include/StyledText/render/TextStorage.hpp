#pragma once

#include "StyledText/text/ContentSizeCategory.hpp"
#include "StyledText/text/StyledTextRun.hpp"

#include <memory>

namespace StyledText {

class TextLayoutEngine;

// Resolved run for one content size category. A storage belongs to the
// first engine it is bound to for the rest of its life.
class TextStorage {
public:
  TextStorage(std::shared_ptr<const StyledTextRun> run, ContentSizeCategory category);

  TextStorage(TextStorage const&) = delete;
  TextStorage& operator=(TextStorage const&) = delete;

  auto run() const -> std::shared_ptr<const StyledTextRun> const& { return run_; }
  auto category() const -> ContentSizeCategory { return category_; }

  // Succeeds for the first engine and for repeat binds to it.
  bool bind(TextLayoutEngine const* engine);
  auto boundEngine() const -> TextLayoutEngine const* { return engine_; }

private:
  std::shared_ptr<const StyledTextRun> run_;
  ContentSizeCategory category_;
  TextLayoutEngine const* engine_ = nullptr;
};

} // namespace StyledText
