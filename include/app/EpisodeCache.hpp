#pragma once
#include "app/Episode.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

namespace xferwatch::app {

// Bounded memo of filename -> episode key. Misses (no pattern matched) are
// stored too so non-episode names are not re-scanned every poll.
// Eviction is first-in-first-out over an explicit insertion queue; lookups
// never refresh an entry's position.
class EpisodeCache {
public:
  explicit EpisodeCache(size_t capacity = 1000);

  // Cached key for filename, computing and inserting it on a miss.
  // With capacity 0 nothing is retained.
  std::optional<EpisodeKey> get_or_compute(const std::string& filename);

  // Wholesale reset; counters are kept
  void clear();

  [[nodiscard]] bool contains(const std::string& filename) const { return entries_.count(filename) != 0; }
  [[nodiscard]] size_t size() const { return entries_.size(); }
  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] bool over_capacity() const { return entries_.size() > capacity_; }

  [[nodiscard]] uint64_t hits() const { return hits_; }
  [[nodiscard]] uint64_t misses() const { return misses_; }
  [[nodiscard]] uint64_t evictions() const { return evictions_; }

private:
  size_t capacity_;
  std::unordered_map<std::string, std::optional<EpisodeKey>> entries_;
  std::deque<std::string> order_; // oldest insertion at front
  uint64_t hits_{0};
  uint64_t misses_{0};
  uint64_t evictions_{0};
};

} // namespace xferwatch::app
