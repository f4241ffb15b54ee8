#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace xferwatch::model {

// How a destination's target size was inferred
enum class MatchMethod { Exact, Episode, Largest, Fallback };

inline const char* to_string(MatchMethod m) {
  switch (m) {
    case MatchMethod::Exact:    return "exact";
    case MatchMethod::Episode:  return "episode";
    case MatchMethod::Largest:  return "largest";
    case MatchMethod::Fallback: return "fallback";
  }
  return "?";
}

// Descriptor numbers are only unique within a process and get recycled after
// close, so a transfer is identified by all three fields together.
struct TransferKey {
  int32_t pid{};
  int32_t fd{};
  std::string path;

  bool operator==(const TransferKey& o) const {
    return pid == o.pid && fd == o.fd && path == o.path;
  }
  bool operator!=(const TransferKey& o) const { return !(*this == o); }
};

struct TransferKeyHash {
  size_t operator()(const TransferKey& k) const noexcept {
    size_t h = std::hash<std::string>{}(k.path);
    h ^= std::hash<int64_t>{}((static_cast<int64_t>(k.pid) << 32) | static_cast<uint32_t>(k.fd))
         + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

// One poll's view of a destination, after source matching
struct TransferObservation {
  int64_t size{};
  int64_t offset{};
  int64_t target_size{1};
  std::optional<std::string> source_path;
  MatchMethod method{MatchMethod::Fallback};
};

// Persistent per-transfer state owned by the tracker.
// position == size always; target_size never decreases.
struct TransferRecord {
  using Clock = std::chrono::steady_clock;

  std::string path;
  std::optional<std::string> source_path;
  int64_t position{};
  int64_t size{};
  int64_t target_size{1};
  int64_t last_position{};
  double throughput{0.0};   // bytes/sec
  MatchMethod method{MatchMethod::Fallback};
  Clock::time_point first_seen{};
  Clock::time_point last_update{};

  [[nodiscard]] double percent() const;
  [[nodiscard]] std::optional<double> eta_seconds() const;
  [[nodiscard]] std::string filename() const;
};

// Row handed to the reporting side
struct TransferView {
  int32_t pid{};
  int32_t fd{};
  std::string process_name;
  std::string filename;
  std::string path;
  std::optional<std::string> source_path;
  int64_t position{};
  int64_t target_size{};
  double percent{};          // 0..100
  double throughput{};       // bytes/sec
  std::optional<double> eta_seconds;
  MatchMethod method{MatchMethod::Fallback};
};

struct TransferSnapshot {
  uint64_t seq{};
  // false until the first poll completes ("no data yet"); an empty transfer
  // list after that means "no active transfers"
  bool has_data{false};
  std::vector<TransferView> transfers;   // ordered by first-seen, then path
  std::vector<int32_t> monitored_pids;
  std::vector<int32_t> active_pids;
  size_t failed_processes{};             // per-process list failures this pass
  size_t episode_cache_entries{};
  size_t skipped_descriptors{};          // unresolvable or vanished mid-scan
};

} // namespace xferwatch::model
