#pragma once

#include "model/Transfer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace xferwatch::ui {

inline constexpr int kMinDashboardRows = 5;
inline constexpr int kMinDashboardCols = 20;
inline constexpr int kMaxBarWidth = 40;
inline constexpr int kBarPadding = 20;

struct DashboardLine {
  std::string text;        // plain, already clipped to the frame width
  Color color{Color::Text};
  bool bold{false};
};

struct DashboardOptions {
  int cols{80};
  int rows{24};
  bool unicode{true};
  std::string title;       // "<name> (PID: n)" or "Monitoring N processes"
  std::string clock;       // HH:MM:SS
};

// Lays out one frame as exactly opts.rows lines. Empty when the terminal is
// smaller than kMinDashboardCols x kMinDashboardRows.
std::vector<DashboardLine> build_dashboard_lines(const model::TransferSnapshot& s,
                                                 const DashboardOptions& opts,
                                                 PathAbbreviator& paths);

std::string dashboard_title(const std::vector<int32_t>& pids);
std::string clock_now();

// Redraws the whole screen from the cursor home position
void render_dashboard(const model::TransferSnapshot& s, const std::string& title,
                      PathAbbreviator& paths);

} // namespace xferwatch::ui
