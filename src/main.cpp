#include "app/Config.hpp"
#include "app/DebugLog.hpp"
#include "app/Monitor.hpp"
#include "collectors/ProcessScanner.hpp"
#include "collectors/ProcfsDescriptorSource.hpp"
#include "ui/Dashboard.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace xferwatch::ui;
namespace app = xferwatch::app;
namespace collectors = xferwatch::collectors;
namespace model = xferwatch::model;

namespace {

void print_usage() {
  std::cout << "Usage: xferwatch [PID ...] [--all] [-d|--debug] [--log FILE] [--config FILE]\n"
               "                 [--iterations N] [--interval-ms MS]\n"
               "\n"
               "Watch media managers copy and move files by inspecting their open descriptors.\n"
               "\n"
               "  PID ...           process id(s) to monitor; omit for interactive selection\n"
               "  --all             monitor every detected manager process\n"
               "  -d, --debug       scan once, print write candidates and exit\n"
               "  --log FILE        write a timestamped debug log to FILE\n"
               "  --config FILE     read settings from FILE instead of the default location\n"
               "  --iterations N    stop after N polls (0 runs until q or Ctrl+C)\n"
               "  --interval-ms MS  poll interval override\n";
}

std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) { if (i) out += sep; out += v[i]; }
  return out;
}

std::optional<int> parse_int(const std::string& s) {
  if (!xferwatch::util::is_number(s)) return std::nullopt;
  try { return std::stoi(s); } catch (const std::out_of_range&) { return std::nullopt; }
}

// nullopt when nothing is running or the user backs out
std::optional<std::vector<int32_t>> select_interactive(const app::MonitorConfig& cfg) {
  auto procs = collectors::find_manager_processes(cfg.managers);
  if (procs.empty()) {
    std::cout << "No manager processes found running.\n"
              << "\nAvailable managers: " << join(cfg.managers, ", ") << "\n"
              << "\nYou can also monitor a specific PID:\n  xferwatch <PID>\n";
    return std::nullopt;
  }
  if (procs.size() == 1) {
    std::cout << "Found: " << procs[0].name << " (PID: " << procs[0].pid << ")\n";
    return std::vector<int32_t>{procs[0].pid};
  }
  std::cout << "Found " << procs.size() << " manager process(es):\n\n";
  for (size_t i = 0; i < procs.size(); ++i)
    std::cout << "  " << (i + 1) << ". " << procs[i].name << " (PID: " << procs[i].pid << ")\n";
  std::cout << "  A. Monitor all\n";
  for (;;) {
    std::cout << "\nSelect process to monitor [1-" << procs.size() << "/A]: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    line.erase(0, line.find_first_not_of(" \t"));
    while (!line.empty() && std::isspace((unsigned char)line.back())) line.pop_back();
    if (line == "a" || line == "A") {
      std::vector<int32_t> all;
      for (const auto& p : procs) all.push_back(p.pid);
      return all;
    }
    auto n = parse_int(line);
    if (!n) return std::nullopt;
    if (*n >= 1 && (size_t)*n <= procs.size()) return std::vector<int32_t>{procs[(size_t)*n - 1].pid};
    std::cout << "Invalid selection\n";
  }
}

int run_debug_scan(collectors::IDescriptorSource& source, const app::MonitorConfig& cfg,
                   const std::vector<int32_t>& pids, app::DebugLog& log) {
  for (auto pid : pids) {
    std::cout << "\nDebug: Scanning /proc/" << pid << "/fd/...\n";
    app::Monitor mon(source, cfg, &log);
    mon.set_always_verbose(true);
    mon.set_pids({pid});
    const auto& snap = mon.poll_once();
    if (snap.failed_processes) {
      std::cout << "Could not list descriptors of PID " << pid << "\n";
      continue;
    }
    if (snap.transfers.empty()) {
      std::cout << "No files found matching criteria\n";
      continue;
    }
    std::cout << "\nFound " << snap.transfers.size() << " file(s) being written:\n";
    for (const auto& t : snap.transfers) {
      char pct[32];
      std::snprintf(pct, sizeof(pct), "%.1f", t.percent);
      std::cout << "\n  FD " << t.fd << ": " << t.path << "\n"
                << "    Position: " << t.position << ", Target: " << t.target_size
                << " (" << model::to_string(t.method) << ")\n";
      if (t.source_path) std::cout << "    Source: " << *t.source_path << "\n";
      std::cout << "    Percent: " << pct << "%\n";
    }
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<int32_t> pids;
  bool all = false;
  bool debug = false;
  std::string log_path;
  std::string config_path;
  int iterations = 0; // 0 => run until q / Ctrl+C
  int interval_ms = 0;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need_value = [&](const char* flag) -> std::optional<std::string> {
      if (i + 1 < argc) return std::string(argv[++i]);
      std::fprintf(stderr, "xferwatch: %s requires a value\n", flag);
      return std::nullopt;
    };
    if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else if (a == "--all") all = true;
    else if (a == "-d" || a == "--debug") debug = true;
    else if (a == "--log") { auto v = need_value("--log"); if (!v) return 2; log_path = *v; }
    else if (a == "--config") { auto v = need_value("--config"); if (!v) return 2; config_path = *v; }
    else if (a == "--iterations" || a == "--interval-ms") {
      auto v = need_value(a.c_str());
      if (!v) return 2;
      auto n = parse_int(*v);
      if (!n) { std::fprintf(stderr, "xferwatch: invalid value for %s: %s\n", a.c_str(), v->c_str()); return 2; }
      (a == "--iterations" ? iterations : interval_ms) = *n;
    }
    else if (auto pid = parse_int(a)) pids.push_back(*pid);
    else {
      std::fprintf(stderr, "xferwatch: unknown argument: %s\n", a.c_str());
      print_usage();
      return 2;
    }
  }

  bool from_file = false;
  auto cfg = app::load_config(config_path.empty() ? app::config_file_path() : config_path, &from_file);
  if (!config_path.empty() && !from_file)
    std::fprintf(stderr, "xferwatch: Config: could not read %s, using defaults\n", config_path.c_str());
  if (interval_ms > 0) cfg.poll_interval_ms = std::clamp(interval_ms, 50, 10000);

  if (!pids.empty()) {
    for (auto pid : pids) {
      if (!collectors::process_exists(pid)) {
        std::cout << "Error: Process " << pid << " does not exist\n";
        return 1;
      }
    }
    if (pids.size() == 1) {
      std::cout << "Monitoring: " << collectors::process_name(pids[0]) << " (PID: " << pids[0] << ")\n";
    } else {
      std::vector<std::string> ids;
      for (auto pid : pids) ids.push_back(std::to_string(pid));
      std::cout << "Monitoring " << pids.size() << " processes: " << join(ids, ", ") << "\n";
    }
  } else if (all) {
    auto procs = collectors::find_manager_processes(cfg.managers);
    if (procs.empty()) {
      std::cout << "No manager processes found running.\n"
                << "\nAvailable managers: " << join(cfg.managers, ", ") << "\n";
      return 1;
    }
    std::cout << "Auto-detected " << procs.size() << " process(es):\n";
    for (const auto& p : procs) {
      std::cout << "  - " << p.name << " (PID: " << p.pid << ")\n";
      pids.push_back(p.pid);
    }
  } else {
    auto picked = select_interactive(cfg);
    if (!picked) return 1;
    pids = *picked;
  }

  std::unique_ptr<app::DebugLog> log = log_path.empty()
      ? std::make_unique<app::DebugLog>()
      : std::make_unique<app::DebugLog>(log_path);
  collectors::ProcfsDescriptorSource source;

  if (debug) return run_debug_scan(source, cfg, pids, *log);

  // Check access before taking over the terminal
  {
    std::vector<model::DescriptorRecord> fds;
    for (auto pid : pids) {
      auto st = source.list(pid, fds);
      if (st == model::ListStatus::PermissionDenied) {
        std::vector<std::string> ids;
        for (auto p : pids) ids.push_back(std::to_string(p));
        std::cout << "\nError: Permission denied for PID " << pid << ". Try running with sudo:\n"
                  << "  sudo " << argv[0] << " " << join(ids, " ") << "\n";
        return 1;
      }
      if (st == model::ListStatus::NotFound) {
        std::cout << "\nError: Process " << pid << " no longer exists\n";
        return 1;
      }
    }
  }

  std::string args;
  for (int i = 0; i < argc; ++i) { if (i) args += ' '; args += argv[i]; }
  log->log("Starting xferwatch with args: " + args);

  app::Monitor monitor(source, cfg, log.get());
  monitor.set_pids(pids);
  PathAbbreviator paths(cfg.path_cache_capacity);
  const std::string title = dashboard_title(pids);
  bool exited = false;
  int last_cols = 0;
  if (!install_sigint_handler())
    std::fprintf(stderr, "xferwatch: Terminal: could not install SIGINT handler\n");
  {
    bool use_alt = cfg.alt_screen && tty_stdout();
    RawTermGuard raw{}; CursorGuard curs{}; AltScreenGuard alt{use_alt};
    std::atexit(&on_atexit_restore);
    if (use_alt) best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);
    render_dashboard(monitor.snapshot(), title, paths);
    for (int i = 0; (iterations <= 0 || i < iterations) && !g_stop.load(); ++i) {
      const auto& snap = monitor.poll_once();
      if (monitor.all_exited()) {
        log->log("All processes exited");
        exited = true;
        break;
      }
      int cols = term_cols();
      if (cols != last_cols) {
        if (last_cols > 0) log->log("Terminal width changed to " + std::to_string(cols) + ", cleared path cache");
        last_cols = cols;
      }
      render_dashboard(snap, title, paths);

      int key = wait_key(cfg.poll_interval_ms);
      if (key == 'q' || key == 'Q') {
        log->log("User quit");
        break;
      }
    }
    if (g_stop.load()) log->log("Interrupted by user");
  }
  if (exited) std::cout << "All monitored processes have exited.\n";
  log->log("Exiting");
  return 0;
}
