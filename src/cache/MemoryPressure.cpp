#include "StyledText/cache/MemoryPressure.hpp"

#include <spdlog/spdlog.h>

namespace StyledText {

auto MemoryPressureHandler::shared() -> MemoryPressureHandler& {
  // Leaked so caches unregistering during static destruction stay valid.
  static auto* handler = new MemoryPressureHandler();
  return *handler;
}

auto MemoryPressureHandler::addListener(Listener listener) -> Token {
  std::lock_guard<std::mutex> lock(mutex);
  Token token = nextToken++;
  listeners.emplace(token, std::move(listener));
  return token;
}

void MemoryPressureHandler::removeListener(Token token) {
  std::lock_guard<std::mutex> lock(mutex);
  listeners.erase(token);
}

void MemoryPressureHandler::notifyMemoryWarning() {
  std::lock_guard<std::mutex> lock(mutex);
  ++warnings;
  spdlog::warn("MemoryPressureHandler: memory warning, notifying {} listeners", listeners.size());
  for (auto const& [token, listener] : listeners) {
    (void)token;
    if (listener) listener();
  }
}

auto MemoryPressureHandler::listenerCount() const -> size_t {
  std::lock_guard<std::mutex> lock(mutex);
  return listeners.size();
}

auto MemoryPressureHandler::warningCount() const -> uint64_t {
  std::lock_guard<std::mutex> lock(mutex);
  return warnings;
}

} // namespace StyledText
