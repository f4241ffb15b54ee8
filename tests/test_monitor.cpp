#include "minitest.hpp"
#include "app/Monitor.hpp"
#include "collectors/IDescriptorSource.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <unistd.h>

using namespace xferwatch;
using model::AccessMode;
using model::DescriptorRecord;
using model::ListStatus;
using Clock = app::Monitor::Clock;
using namespace std::chrono_literals;

namespace {

// Scripted descriptor tables per pid
class FakeSource : public collectors::IDescriptorSource {
public:
  std::map<int32_t, std::vector<DescriptorRecord>> tables;
  std::map<int32_t, ListStatus> status;
  std::map<int32_t, int> calls;
  size_t skipped{0};

  ListStatus list(int32_t pid, std::vector<DescriptorRecord>& out) override {
    ++calls[pid];
    out.clear();
    auto st = status.count(pid) ? status[pid] : ListStatus::Ok;
    if (st != ListStatus::Ok) return st;
    if (tables.count(pid)) out = tables[pid];
    return ListStatus::Ok;
  }
  size_t last_skipped() const override { return skipped; }
  const char* name() const override { return "fake"; }
};

DescriptorRecord rec(int32_t fd, const std::string& path, int64_t size, AccessMode mode) {
  DescriptorRecord r;
  r.fd = fd;
  r.path = path;
  r.size = size;
  r.offset = size;
  r.mode = mode;
  return r;
}

app::MonitorConfig test_config() {
  auto c = app::default_config();
  c.poll_interval_ms = 50;
  return c;
}

std::string read_all(const std::string& p) {
  std::ifstream in(p);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(monitor_tracks_exact_match) {
  FakeSource src;
  src.tables[1] = {
    rec(3, "/dl/Show.S01E05.mkv", 1000, AccessMode::ReadOnly),
    rec(4, "/tv/Show/Show.S01E05.mkv", 100, AccessMode::WriteOnly),
  };
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("Sonarr"); });
  ASSERT_TRUE(!mon.snapshot().has_data);
  mon.set_pids({1});
  const auto& s = mon.poll_once(Clock::now());
  ASSERT_TRUE(s.has_data);
  ASSERT_EQ(s.seq, (uint64_t)1);
  ASSERT_EQ(s.transfers.size(), (size_t)1);
  const auto& t = s.transfers[0];
  ASSERT_EQ(t.pid, 1);
  ASSERT_EQ(t.fd, 4);
  ASSERT_EQ(t.process_name, "Sonarr");
  ASSERT_EQ(t.filename, "Show.S01E05.mkv");
  ASSERT_EQ(*t.source_path, "/dl/Show.S01E05.mkv");
  ASSERT_EQ(t.target_size, 1000);
  ASSERT_NEAR(t.percent, 10.0, 1e-9);
  ASSERT_TRUE(t.method == model::MatchMethod::Exact);
}

TEST(monitor_progress_across_polls) {
  FakeSource src;
  src.tables[1] = {
    rec(3, "/dl/movie.mkv", 1000, AccessMode::ReadOnly),
    rec(4, "/movies/movie.mkv", 200, AccessMode::WriteOnly),
  };
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("Radarr"); });
  mon.set_pids({1});
  auto t0 = Clock::now();
  (void)mon.poll_once(t0);
  src.tables[1][1].size = 600;
  const auto& s = mon.poll_once(t0 + 2s);
  ASSERT_EQ(s.transfers.size(), (size_t)1);
  ASSERT_EQ(s.transfers[0].position, 600);
  ASSERT_NEAR(s.transfers[0].throughput, 200.0, 1e-6);
  ASSERT_TRUE(s.transfers[0].eta_seconds.has_value());
  ASSERT_NEAR(*s.transfers[0].eta_seconds, 2.0, 1e-6);

  // Writer closes the file
  src.tables[1].pop_back();
  ASSERT_TRUE(mon.poll_once(t0 + 3s).transfers.empty());
}

TEST(monitor_ignores_database_writes) {
  FakeSource src;
  src.tables[1] = {
    rec(3, "/config/sonarr.db", 4096, AccessMode::ReadWrite),
    rec(4, "/config/sonarr.db-wal", 100, AccessMode::ReadWrite),
    rec(5, "/config/logs/sonarr.txt", 100, AccessMode::WriteOnly),
  };
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("Sonarr"); });
  mon.set_pids({1});
  const auto& s = mon.poll_once(Clock::now());
  ASSERT_TRUE(s.has_data);
  ASSERT_TRUE(s.transfers.empty());
}

TEST(monitor_failure_is_isolated_per_process) {
  FakeSource src;
  src.tables[1] = {rec(4, "/tv/a.mkv", 10, AccessMode::WriteOnly)};
  src.status[2] = ListStatus::PermissionDenied;
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t p){ return "P" + std::to_string(p); });
  mon.set_pids({1, 2});
  const auto& s = mon.poll_once(Clock::now());
  ASSERT_EQ(s.failed_processes, (size_t)1);
  ASSERT_EQ(s.transfers.size(), (size_t)1);
  ASSERT_EQ(s.transfers[0].target_size, 10);
  ASSERT_TRUE(s.transfers[0].method == model::MatchMethod::Fallback);
  ASSERT_EQ(s.active_pids.size(), (size_t)2);
  ASSERT_TRUE(!mon.all_exited());
  // Permission failures are retried
  (void)mon.poll_once(Clock::now());
  ASSERT_EQ(src.calls[2], 2);
}

TEST(monitor_detects_exited_processes) {
  FakeSource src;
  src.tables[1] = {rec(4, "/tv/a.mkv", 10, AccessMode::WriteOnly)};
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("x"); });
  mon.set_pids({1, 2, 2});
  ASSERT_EQ(mon.snapshot().monitored_pids.size(), (size_t)2);
  src.status[2] = ListStatus::NotFound;
  (void)mon.poll_once(Clock::now());
  ASSERT_TRUE(!mon.all_exited());
  ASSERT_EQ(mon.snapshot().active_pids.size(), (size_t)1);

  src.status[1] = ListStatus::NotFound;
  const auto& s = mon.poll_once(Clock::now());
  ASSERT_TRUE(mon.all_exited());
  ASSERT_TRUE(s.transfers.empty());
  // Gone processes are not scanned again
  (void)mon.poll_once(Clock::now());
  ASSERT_EQ(src.calls[2], 1);
}

TEST(monitor_retries_unavailable_listing) {
  FakeSource src;
  src.tables[1] = {rec(4, "/tv/a.mkv", 10, AccessMode::WriteOnly)};
  src.status[1] = ListStatus::Unavailable;
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("x"); });
  mon.set_pids({1});
  const auto& s1 = mon.poll_once(Clock::now());
  ASSERT_EQ(s1.failed_processes, (size_t)1);
  ASSERT_TRUE(s1.transfers.empty());
  ASSERT_TRUE(!mon.all_exited());
  ASSERT_EQ(s1.active_pids.size(), (size_t)1);

  src.status.erase(1);
  const auto& s2 = mon.poll_once(Clock::now());
  ASSERT_EQ(src.calls[1], 2);
  ASSERT_EQ(s2.failed_processes, (size_t)0);
  ASSERT_EQ(s2.transfers.size(), (size_t)1);
  ASSERT_TRUE(!mon.all_exited());
}

TEST(monitor_orders_by_first_seen_then_path) {
  FakeSource src;
  src.tables[1] = {rec(5, "/tv/b.mkv", 10, AccessMode::WriteOnly)};
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("x"); });
  mon.set_pids({1});
  auto t0 = Clock::now();
  (void)mon.poll_once(t0);
  src.tables[1].push_back(rec(6, "/tv/c.mkv", 10, AccessMode::WriteOnly));
  src.tables[1].push_back(rec(4, "/tv/a.mkv", 10, AccessMode::WriteOnly));
  const auto& s = mon.poll_once(t0 + 1s);
  ASSERT_EQ(s.transfers.size(), (size_t)3);
  ASSERT_EQ(s.transfers[0].path, "/tv/b.mkv");
  ASSERT_EQ(s.transfers[1].path, "/tv/a.mkv");
  ASSERT_EQ(s.transfers[2].path, "/tv/c.mkv");
}

TEST(monitor_episode_cache_stays_bounded) {
  FakeSource src;
  for (int i = 1; i <= 20; ++i) {
    auto ep = "Show.S01E" + std::to_string(i) + ".mkv";
    src.tables[1].push_back(rec(100 + i, "/dl/x" + ep, 1000 + i, AccessMode::ReadOnly));
    src.tables[1].push_back(rec(200 + i, "/tv/" + ep, 10, AccessMode::WriteOnly));
  }
  auto cfg = test_config();
  cfg.episode_cache_capacity = 4;
  app::Monitor mon(src, cfg);
  mon.set_name_resolver([](int32_t){ return std::string("x"); });
  mon.set_pids({1});
  const auto& s = mon.poll_once(Clock::now());
  ASSERT_EQ(s.transfers.size(), (size_t)20);
  ASSERT_TRUE(s.episode_cache_entries <= 4);
  for (const auto& t : s.transfers) {
    ASSERT_TRUE(t.method == model::MatchMethod::Episode);
    ASSERT_EQ(*t.source_path, "/dl/x" + t.filename);
  }
  // Per-insert eviction holds the bound across passes without a wholesale clear
  const auto& again = mon.poll_once(Clock::now());
  ASSERT_EQ(again.episode_cache_entries, (size_t)4);
  ASSERT_EQ(again.transfers.size(), (size_t)20);
}

TEST(monitor_reports_skipped_descriptors) {
  FakeSource src;
  src.skipped = 3;
  app::Monitor mon(src, test_config());
  mon.set_name_resolver([](int32_t){ return std::string("x"); });
  mon.set_pids({1});
  ASSERT_EQ(mon.poll_once(Clock::now()).skipped_descriptors, (size_t)3);
}

TEST(monitor_writes_debug_log) {
  auto path = std::string("/tmp/xferwatch_test_monitor_log_") + std::to_string(::getpid()) + ".log";
  {
    app::DebugLog log(path);
    FakeSource src;
    src.tables[1] = {rec(4, "/tv/ep.mkv", 10, AccessMode::WriteOnly)};
    app::Monitor mon(src, test_config(), &log);
    mon.set_name_resolver([](int32_t){ return std::string("x"); });
    mon.set_pids({1});
    auto t0 = Clock::now();
    (void)mon.poll_once(t0);
    src.tables[1].clear();
    (void)mon.poll_once(t0 + 1s);
  }
  auto txt = read_all(path);
  ASSERT_TRUE(txt.find("=== Scan iteration 1 ===") != std::string::npos);
  ASSERT_TRUE(txt.find("VERBOSE SCAN of PID 1") != std::string::npos);
  ASSERT_TRUE(txt.find("New file tracked: ep.mkv at 10/10 (fallback)") != std::string::npos);
  ASSERT_TRUE(txt.find("File closed: ep.mkv") != std::string::npos);
  ASSERT_TRUE(txt.find("=== Scan iteration 2 ===") == std::string::npos);
  std::error_code ec;
  std::filesystem::remove(path, ec);
}
