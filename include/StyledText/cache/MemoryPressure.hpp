#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace StyledText {

// Process-wide fan-out for low-memory signals. The embedding application
// forwards its platform notification to notifyMemoryWarning().
//
// Listeners run on the notifying thread while the handler lock is held, so
// a listener must not add or remove listeners itself.
class MemoryPressureHandler {
public:
  using Listener = std::function<void()>;
  using Token = uint64_t;

  static auto shared() -> MemoryPressureHandler&;

  MemoryPressureHandler() = default;
  MemoryPressureHandler(MemoryPressureHandler const&) = delete;
  MemoryPressureHandler& operator=(MemoryPressureHandler const&) = delete;

  auto addListener(Listener listener) -> Token;
  void removeListener(Token token);
  void notifyMemoryWarning();

  auto listenerCount() const -> size_t;
  auto warningCount() const -> uint64_t;

private:
  mutable std::mutex mutex;
  std::map<Token, Listener> listeners;
  Token nextToken = 1;
  uint64_t warnings = 0;
};

} // namespace StyledText
