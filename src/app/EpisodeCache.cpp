#include "app/EpisodeCache.hpp"

namespace xferwatch::app {

EpisodeCache::EpisodeCache(size_t capacity) : capacity_(capacity) {}

std::optional<EpisodeKey> EpisodeCache::get_or_compute(const std::string& filename) {
  auto it = entries_.find(filename);
  if (it != entries_.end()) { ++hits_; return it->second; }
  ++misses_;
  auto key = extract_episode_key(filename);
  if (capacity_ == 0) return key;
  while (entries_.size() >= capacity_ && !order_.empty()) {
    entries_.erase(order_.front());
    order_.pop_front();
    ++evictions_;
  }
  entries_.emplace(filename, key);
  order_.push_back(filename);
  return key;
}

void EpisodeCache::clear() {
  entries_.clear();
  order_.clear();
}

} // namespace xferwatch::app
