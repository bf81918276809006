#include "StyledText/cache/BoundedCache.hpp"
#include "StyledText/cache/MemoryPressure.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>

using namespace StyledText;

TEST_SUITE_BEGIN("styledtext.memory_pressure");

TEST_CASE("listeners_run_until_removed") {
  auto& handler = MemoryPressureHandler::shared();
  int calls = 0;
  auto token = handler.addListener([&calls] { ++calls; });
  uint64_t warningsBefore = handler.warningCount();

  handler.notifyMemoryWarning();
  CHECK(calls == 1);
  CHECK(handler.warningCount() == warningsBefore + 1u);

  handler.removeListener(token);
  handler.notifyMemoryWarning();
  CHECK(calls == 1);
}

TEST_CASE("only_registered_caches_clear") {
  BoundedCache<std::string, int> registered(8, {}, CompactionPolicy::Default(), true, "registered");
  BoundedCache<std::string, int> unregistered(8);
  registered.set("a", 1);
  unregistered.set("a", 1);

  MemoryPressureHandler::shared().notifyMemoryWarning();
  CHECK(registered.count() == 0u);
  CHECK(unregistered.count() == 1u);
}

TEST_CASE("destroyed_cache_unregisters") {
  auto& handler = MemoryPressureHandler::shared();
  size_t before = handler.listenerCount();
  {
    auto cache = std::make_unique<BoundedCache<std::string, int>>(4, BoundedCache<std::string, int>::CostFunction{},
                                                                   CompactionPolicy::Default(), true);
    CHECK(handler.listenerCount() == before + 1u);
  }
  CHECK(handler.listenerCount() == before);
  handler.notifyMemoryWarning();
}

TEST_SUITE_END();
