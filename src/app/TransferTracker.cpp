#include "app/TransferTracker.hpp"

#include <algorithm>

namespace xferwatch::app {

using model::TransferObservation;
using model::TransferRecord;

TransferTracker::TransferTracker(double expansion_threshold)
  : threshold_(expansion_threshold < 1.0 ? 1.0 : expansion_threshold) {}

void TransferTracker::update(TransferRecord& rec, const TransferObservation& obs, Clock::time_point now) {
  // Position tracks size, not the fd offset: buffered or seeking writers leave
  // the offset meaningless for progress.
  const int64_t size = obs.size;
  double elapsed = std::chrono::duration<double>(now - rec.last_update).count();
  if (size <= rec.last_position) {
    rec.throughput = 0.0;
  } else if (elapsed > 0.0) {
    rec.throughput = static_cast<double>(size - rec.last_position) / elapsed;
  }
  if (static_cast<double>(size) > static_cast<double>(rec.target_size) * threshold_) {
    rec.target_size = size;
    ++stats_.expanded;
  }
  rec.last_position = size;
  rec.position = size;
  rec.size = size;
  rec.last_update = now;
}

const TransferMap& TransferTracker::reconcile(const ObservationMap& current, Clock::time_point now) {
  stats_ = {};
  closed_.clear();

  for (auto it = records_.begin(); it != records_.end(); ) {
    if (current.find(it->first) == current.end()) {
      closed_.emplace_back(it->first, std::move(it->second));
      it = records_.erase(it);
      ++stats_.dropped;
    } else {
      ++it;
    }
  }

  for (const auto& [key, obs] : current) {
    auto it = records_.find(key);
    if (it != records_.end()) {
      if (obs.size < 0) { ++stats_.stale; continue; }
      update(it->second, obs, now);
      ++stats_.updated;
      continue;
    }
    if (obs.size < 0) continue;
    TransferRecord rec;
    rec.path = key.path;
    rec.source_path = obs.source_path;
    rec.method = obs.method;
    rec.size = obs.size;
    // Partially written files start partway; position is never reset to 0
    rec.position = obs.size;
    rec.last_position = obs.size;
    rec.target_size = std::max<int64_t>(obs.target_size, 1);
    rec.throughput = 0.0;
    rec.first_seen = now;
    rec.last_update = now;
    records_.emplace(key, std::move(rec));
    ++stats_.created;
  }
  return records_;
}

} // namespace xferwatch::app
