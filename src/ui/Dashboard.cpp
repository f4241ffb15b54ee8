#include "ui/Dashboard.hpp"
#include "collectors/ProcessScanner.hpp"

#include <unistd.h>

#include <algorithm>
#include <ctime>

namespace xferwatch::ui {

namespace {

void put(std::vector<DashboardLine>& out, int row, std::string text, Color c, int width, bool bold = false) {
  if (row < 0 || row >= (int)out.size()) return;
  out[row] = DashboardLine{take_cols(text, width), c, bold};
}

} // namespace

std::string dashboard_title(const std::vector<int32_t>& pids) {
  if (pids.size() == 1) {
    return collectors::process_name(pids[0]) + " (PID: " + std::to_string(pids[0]) + ")";
  }
  return "Monitoring " + std::to_string(pids.size()) + " processes";
}

std::string clock_now() {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[16];
  if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &lt) == 0) return std::string();
  return buf;
}

std::vector<DashboardLine> build_dashboard_lines(const model::TransferSnapshot& s,
                                                 const DashboardOptions& opts,
                                                 PathAbbreviator& paths) {
  const int rows = opts.rows;
  const int cols = opts.cols;
  if (rows < kMinDashboardRows || cols < kMinDashboardCols) return {};
  const int w = cols - 1;

  std::vector<DashboardLine> out((size_t)rows);
  put(out, 0, "xferwatch - " + opts.title, Color::Header, w, true);
  std::string status = "Time: " + opts.clock;
  if (s.has_data && s.failed_processes)
    status += "  unreadable: " + std::to_string(s.failed_processes);
  if (s.has_data && s.skipped_descriptors)
    status += "  churn: " + std::to_string(s.skipped_descriptors);
  put(out, 1, status, Color::Text, w);
  std::string rule;
  for (int i = 0; i < std::min(w, 80); ++i) rule += opts.unicode ? "\xE2\x94\x80" : "-";
  put(out, 2, rule, Color::Text, w);

  const std::string footer = "Press 'q' to quit";
  if (!s.has_data) {
    put(out, 4, "Waiting for first scan...", Color::Notice, w);
    put(out, rows - 1, footer, Color::Text, w);
    return out;
  }
  if (s.transfers.empty()) {
    put(out, 4, "No active file writes detected...", Color::Notice, w);
    put(out, rows - 1, footer, Color::Text, w);
    return out;
  }

  int row = 4;
  const int path_w = cols - 3;
  const int bar_w = std::min(kMaxBarWidth, cols - kBarPadding);
  for (const auto& t : s.transfers) {
    if (row >= rows - 3) break;
    put(out, row++, "[" + t.process_name + "] " + t.filename, Color::Name, w, true);
    if (t.source_path) {
      put(out, row++, "  " + paths.get(*t.source_path, path_w), Color::Source, w);
    }
    put(out, row++, "  " + paths.get(t.path, path_w), Color::Dest, w);
    if (bar_w > 0) put(out, row, "  " + progress_bar(t.percent, bar_w, opts.unicode), Color::Bar, w);
    ++row;

    std::string size_str = "  " + format_size((double)t.position) + " / " + format_size((double)t.target_size);
    if (t.throughput > 0) {
      std::string info = "  Speed: " + format_speed(t.throughput) + "  ETA: " + format_eta(t.eta_seconds);
      if (display_cols(size_str) + display_cols(info) < w) size_str += info;
    }
    put(out, row, size_str, Color::Text, w);
    row += 2;
    if (row >= rows - 2) break;
  }
  put(out, rows - 1, footer, Color::Text, w);
  return out;
}

void render_dashboard(const model::TransferSnapshot& s, const std::string& title,
                      PathAbbreviator& paths) {
  DashboardOptions opts;
  opts.cols = term_cols();
  opts.rows = term_rows();
  opts.unicode = use_unicode();
  opts.title = title;
  opts.clock = clock_now();
  paths.set_terminal_width(opts.cols);

  auto lines = build_dashboard_lines(s, opts, paths);
  if (lines.empty()) return;

  // The speed/ETA suffix shares the size line but gets its own color
  std::string frame;
  frame.reserve((size_t)opts.rows * (size_t)opts.cols + 64);
  frame += "\x1B[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    const auto& l = lines[i];
    std::string text = l.text;
    auto speed = text.find("  Speed: ");
    if (l.color == Color::Text && speed != std::string::npos) {
      text = text.substr(0, speed) + sgr(Color::Rate) + text.substr(speed);
    }
    if (l.bold) frame += sgr_bold();
    frame += sgr(l.color) + text + sgr_reset() + "\x1B[K";
    if (i + 1 < lines.size()) frame += "\n";
  }
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

} // namespace xferwatch::ui
