#pragma once
#include "model/Transfer.hpp"
#include <chrono>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xferwatch::app {

using TransferMap = std::unordered_map<model::TransferKey, model::TransferRecord, model::TransferKeyHash>;
using ObservationMap = std::unordered_map<model::TransferKey, model::TransferObservation, model::TransferKeyHash>;

// What the last reconcile() did, for logging
struct ReconcileStats {
  size_t created{0};
  size_t updated{0};
  size_t stale{0};     // present but skipped (invalid size)
  size_t dropped{0};
  size_t expanded{0};  // target size grown this pass
};

// Owns the lifecycle of every active transfer. One reconcile() per poll:
// keys seen before are updated in place, new keys are created, keys missing
// from the poll are dropped immediately.
class TransferTracker {
public:
  using Clock = model::TransferRecord::Clock;

  // Expand target once size exceeds target * threshold (>= 1.0)
  explicit TransferTracker(double expansion_threshold = 1.1);

  const TransferMap& reconcile(const ObservationMap& current, Clock::time_point now);
  const TransferMap& reconcile(const ObservationMap& current) { return reconcile(current, Clock::now()); }

  [[nodiscard]] const TransferMap& records() const { return records_; }
  [[nodiscard]] const ReconcileStats& last_stats() const { return stats_; }
  [[nodiscard]] double expansion_threshold() const { return threshold_; }

  // Keys dropped by the last reconcile(), with their final state
  [[nodiscard]] const std::vector<std::pair<model::TransferKey, model::TransferRecord>>& closed() const { return closed_; }

  void clear() { records_.clear(); closed_.clear(); stats_ = {}; }

private:
  void update(model::TransferRecord& rec, const model::TransferObservation& obs, Clock::time_point now);

  double threshold_;
  TransferMap records_;
  std::vector<std::pair<model::TransferKey, model::TransferRecord>> closed_;
  ReconcileStats stats_{};
};

} // namespace xferwatch::app
