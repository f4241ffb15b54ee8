#include "app/Monitor.hpp"
#include "app/SourceMatcher.hpp"
#include "collectors/ProcessScanner.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace xferwatch::app {

using model::ListStatus;
using model::TransferKey;
using model::TransferObservation;

Monitor::Monitor(collectors::IDescriptorSource& source, MonitorConfig config, DebugLog* log)
  : source_(source),
    config_(std::move(config)),
    log_(log),
    ignore_(make_extension_set(config_.ignore_extensions)),
    cache_(config_.episode_cache_capacity),
    tracker_(config_.expansion_threshold),
    resolve_name_([](int32_t pid){ return collectors::process_name(pid); }) {}

void Monitor::set_pids(const std::vector<int32_t>& pids) {
  pids_.clear();
  for (auto pid : pids) {
    if (std::find(pids_.begin(), pids_.end(), pid) == pids_.end()) pids_.push_back(pid);
  }
  exited_.clear();
  names_.clear();
  snapshot_.monitored_pids = pids_;
}

bool Monitor::all_exited() const {
  if (pids_.empty()) return false;
  for (auto pid : pids_) if (exited_.find(pid) == exited_.end()) return false;
  return true;
}

void Monitor::log(const std::string& msg) {
  if (log_) log_->log(msg);
}

const std::string& Monitor::name_of(int32_t pid) {
  auto it = names_.find(pid);
  if (it != names_.end()) return it->second;
  return names_.emplace(pid, resolve_name_(pid)).first->second;
}

void Monitor::scan_pid(int32_t pid, bool verbose, ObservationMap& current) {
  auto status = source_.list(pid, scratch_);
  skipped_this_pass_ += source_.last_skipped();
  if (status != ListStatus::Ok) {
    ++failed_this_pass_;
    if (status == ListStatus::NotFound) exited_.insert(pid);
    log("PID " + std::to_string(pid) + ": " + model::to_string(status));
    return;
  }

  if (verbose) {
    log("=== VERBOSE SCAN of PID " + std::to_string(pid) + " (" + source_.name() + ") ===");
    for (const auto& r : scratch_) {
      std::ostringstream os;
      os << "  FD " << r.fd << ": " << r.path << " size=" << r.size << " pos=" << r.offset
         << " mode=" << model::to_string(r.mode) << (r.regular_file ? "" : " (not regular)");
      log(os.str());
    }
  }

  auto cls = classify(scratch_, ignore_);
  for (const auto& d : cls.destinations) {
    auto m = match_source(base_name(d.path), d.size, cls.sources, cache_);
    if (verbose) {
      std::ostringstream os;
      os << "  Write file: " << base_name(d.path) << " current=" << d.size << " target=" << m.target_size
         << " match=" << model::to_string(m.method)
         << " source=" << (m.source_path ? *m.source_path : std::string("none"));
      log(os.str());
    }
    TransferObservation obs;
    obs.size = d.size;
    obs.target_size = m.target_size;
    obs.source_path = std::move(m.source_path);
    obs.method = m.method;
    current[TransferKey{pid, d.fd, d.path}] = std::move(obs);
  }
  if (verbose) {
    log("  Result: " + std::to_string(cls.destinations.size()) + " writable files, " +
        std::to_string(cls.sources.size()) + " read files");
  }
}

const model::TransferSnapshot& Monitor::poll_once(Clock::time_point now) {
  ++iteration_;
  bool verbose = always_verbose_ || iteration_ == 1 ||
                 (config_.verbose_log_interval > 0 && iteration_ % static_cast<uint64_t>(config_.verbose_log_interval) == 0);
  if (verbose) log("=== Scan iteration " + std::to_string(iteration_) + " ===");

  // Coarse remedy on top of per-insert eviction. get_or_compute never grows
  // the cache past capacity, so this only fires if that bound is broken.
  if (cache_.over_capacity()) {
    log("Episode cache size " + std::to_string(cache_.size()) + " exceeded limit, clearing");
    cache_.clear();
  }

  failed_this_pass_ = 0;
  skipped_this_pass_ = 0;
  ObservationMap current;
  for (auto pid : pids_) {
    if (exited_.count(pid)) continue;
    scan_pid(pid, verbose, current);
  }
  if (verbose) log("Total files found across all PIDs: " + std::to_string(current.size()));

  tracker_.reconcile(current, now);
  const auto& st = tracker_.last_stats();
  if (st.created || st.dropped) {
    for (const auto& [key, rec] : tracker_.records()) {
      if (rec.first_seen != now) continue;
      log("  New file tracked: " + rec.filename() + " at " + std::to_string(rec.position) + "/" +
          std::to_string(rec.target_size) + " (" + model::to_string(rec.method) + ")");
    }
    for (const auto& [key, rec] : tracker_.closed()) {
      log("  File closed: " + rec.filename());
    }
  }
  if (st.stale) log("  Skipped " + std::to_string(st.stale) + " update(s) with invalid size");

  build_snapshot();
  return snapshot_;
}

void Monitor::build_snapshot() {
  auto& s = snapshot_;
  s.seq += 1;
  s.has_data = true;
  s.monitored_pids = pids_;
  s.active_pids.clear();
  for (auto pid : pids_) if (!exited_.count(pid)) s.active_pids.push_back(pid);
  s.failed_processes = failed_this_pass_;
  s.skipped_descriptors = skipped_this_pass_;
  s.episode_cache_entries = cache_.size();

  std::vector<std::pair<const TransferKey*, const model::TransferRecord*>> rows;
  rows.reserve(tracker_.records().size());
  for (const auto& [key, rec] : tracker_.records()) rows.emplace_back(&key, &rec);
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b){
    if (a.second->first_seen != b.second->first_seen) return a.second->first_seen < b.second->first_seen;
    if (a.first->path != b.first->path) return a.first->path < b.first->path;
    if (a.first->pid != b.first->pid) return a.first->pid < b.first->pid;
    return a.first->fd < b.first->fd;
  });

  s.transfers.clear();
  s.transfers.reserve(rows.size());
  for (const auto& [key, rec] : rows) {
    model::TransferView v;
    v.pid = key->pid;
    v.fd = key->fd;
    v.process_name = name_of(key->pid);
    v.filename = rec->filename();
    v.path = rec->path;
    v.source_path = rec->source_path;
    v.position = rec->position;
    v.target_size = rec->target_size;
    v.percent = rec->percent();
    v.throughput = rec->throughput;
    v.eta_seconds = rec->eta_seconds();
    v.method = rec->method;
    s.transfers.push_back(std::move(v));
  }
}

} // namespace xferwatch::app
