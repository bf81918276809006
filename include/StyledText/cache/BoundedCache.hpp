#pragma once

#include "StyledText/cache/MemoryPressure.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace StyledText {

// How far an over-budget cache trims. Default trims back to maxCost;
// Percent(p) trims to p * maxCost so a burst of inserts does not evict on
// every call.
struct CompactionPolicy {
  float ratio = 1.0f;

  static constexpr auto Default() -> CompactionPolicy { return CompactionPolicy{1.0f}; }
  static constexpr auto Percent(float p) -> CompactionPolicy {
    return CompactionPolicy{std::clamp(p, 0.0f, 1.0f)};
  }

  auto target(size_t maxCost) const -> size_t {
    return static_cast<size_t>(static_cast<double>(maxCost) * static_cast<double>(ratio));
  }
};

struct BoundedCacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t insertions = 0;
  uint64_t evictions = 0;
  size_t count = 0;
  size_t totalCost = 0;
  size_t maxCost = 0;
};

// Least-recently-used map bounded by aggregate cost. Every member function
// is safe to call concurrently; the lock is held only for bookkeeping and
// never while values are produced.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class BoundedCache {
public:
  using CostFunction = std::function<size_t(Value const&)>;

  explicit BoundedCache(size_t maxCost,
                        CostFunction cost = {},
                        CompactionPolicy compaction = CompactionPolicy::Default(),
                        bool clearOnMemoryWarning = false,
                        std::string name = "cache")
      : maxCost_(maxCost),
        cost_(std::move(cost)),
        compaction_(compaction),
        name_(std::move(name)) {
    if (clearOnMemoryWarning) {
      warningToken_ = MemoryPressureHandler::shared().addListener([this] {
        size_t dropped = clear();
        spdlog::warn("BoundedCache '{}': cleared {} entries on memory warning", name_, dropped);
      });
    }
  }

  ~BoundedCache() {
    if (warningToken_) MemoryPressureHandler::shared().removeListener(*warningToken_);
  }

  BoundedCache(BoundedCache const&) = delete;
  BoundedCache& operator=(BoundedCache const&) = delete;

  // Refreshes recency and records a hit or miss.
  auto get(Key const& key) -> std::optional<Value> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++stats_.misses;
      return std::nullopt;
    }
    ++stats_.hits;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->value;
  }

  // Reads without touching recency or statistics.
  auto peek(Key const& key) const -> std::optional<Value> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second->value;
  }

  // Returns false when the value alone is costlier than the whole cache.
  bool set(Key const& key, Value value) {
    size_t cost = costOf(value);
    std::lock_guard<std::mutex> lock(mutex_);
    if (cost > maxCost_) {
      spdlog::warn("BoundedCache '{}': rejecting entry of cost {} above capacity {}", name_, cost, maxCost_);
      return false;
    }
    if (auto it = index_.find(key); it != index_.end()) {
      totalCost_ -= it->second->cost;
      it->second->value = std::move(value);
      it->second->cost = cost;
      entries_.splice(entries_.begin(), entries_, it->second);
    } else {
      entries_.push_front(Entry{key, std::move(value), cost});
      index_.emplace(key, entries_.begin());
    }
    totalCost_ += cost;
    ++stats_.insertions;
    if (totalCost_ > maxCost_) compactLocked();
    return true;
  }

  bool remove(Key const& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    totalCost_ -= it->second->cost;
    entries_.erase(it->second);
    index_.erase(it);
    return true;
  }

  // Returns the number of dropped entries.
  auto clear() -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = entries_.size();
    entries_.clear();
    index_.clear();
    totalCost_ = 0;
    return dropped;
  }

  auto count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  auto totalCost() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalCost_;
  }

  auto maxCost() const -> size_t { return maxCost_; }
  auto compaction() const -> CompactionPolicy { return compaction_; }
  auto name() const -> std::string const& { return name_; }

  auto stats() const -> BoundedCacheStats {
    std::lock_guard<std::mutex> lock(mutex_);
    BoundedCacheStats out = stats_;
    out.count = entries_.size();
    out.totalCost = totalCost_;
    out.maxCost = maxCost_;
    return out;
  }

  void resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = BoundedCacheStats{};
  }

private:
  struct Entry {
    Key key;
    Value value;
    size_t cost = 0;
  };
  using EntryList = std::list<Entry>;

  auto costOf(Value const& value) const -> size_t {
    return cost_ ? cost_(value) : size_t{1};
  }

  void compactLocked() {
    size_t target = std::min(compaction_.target(maxCost_), maxCost_);
    while (totalCost_ > target && !entries_.empty()) {
      Entry const& victim = entries_.back();
      totalCost_ -= victim.cost;
      index_.erase(victim.key);
      entries_.pop_back();
      ++stats_.evictions;
    }
  }

  size_t const maxCost_;
  CostFunction const cost_;
  CompactionPolicy const compaction_;
  std::string const name_;
  std::optional<MemoryPressureHandler::Token> warningToken_;

  mutable std::mutex mutex_;
  EntryList entries_;
  std::unordered_map<Key, typename EntryList::iterator, Hash> index_;
  size_t totalCost_ = 0;
  BoundedCacheStats stats_;
};

} // namespace StyledText
