#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "app/Config.hpp"
#include "app/DebugLog.hpp"
#include "app/EpisodeCache.hpp"
#include "app/TransferClassifier.hpp"
#include "app/TransferTracker.hpp"
#include "collectors/IDescriptorSource.hpp"
#include "model/Transfer.hpp"

namespace xferwatch::app {

// The polling loop body. Each poll_once() scans every monitored pid through the
// descriptor source, classifies and matches the results, reconciles them into
// the tracker and rebuilds the report snapshot. Single-threaded: the episode
// cache and tracker are only touched from here, so nothing is locked.
class Monitor {
public:
  using Clock = std::chrono::steady_clock;
  using NameResolver = std::function<std::string(int32_t)>;

  Monitor(collectors::IDescriptorSource& source, MonitorConfig config, DebugLog* log = nullptr);

  void set_pids(const std::vector<int32_t>& pids);
  // Defaults to /proc/<pid>/comm
  void set_name_resolver(NameResolver resolver) { resolve_name_ = std::move(resolver); }
  // Verbose-log every poll regardless of verbose_log_interval
  void set_always_verbose(bool on) { always_verbose_ = on; }

  const model::TransferSnapshot& poll_once(Clock::time_point now);
  const model::TransferSnapshot& poll_once() { return poll_once(Clock::now()); }

  [[nodiscard]] const model::TransferSnapshot& snapshot() const { return snapshot_; }
  // True once every monitored pid has been reported gone
  [[nodiscard]] bool all_exited() const;
  [[nodiscard]] const MonitorConfig& config() const { return config_; }

private:
  void scan_pid(int32_t pid, bool verbose, ObservationMap& current);
  void build_snapshot();
  void log(const std::string& msg);
  [[nodiscard]] const std::string& name_of(int32_t pid);

  collectors::IDescriptorSource& source_;
  MonitorConfig config_;
  DebugLog* log_;
  ExtensionSet ignore_;
  EpisodeCache cache_;
  TransferTracker tracker_;
  NameResolver resolve_name_;
  bool always_verbose_{false};

  std::vector<int32_t> pids_;
  std::unordered_set<int32_t> exited_;
  std::unordered_map<int32_t, std::string> names_;
  uint64_t iteration_{0};
  size_t failed_this_pass_{0};
  size_t skipped_this_pass_{0};
  std::vector<model::DescriptorRecord> scratch_;
  model::TransferSnapshot snapshot_{};
};

} // namespace xferwatch::app
