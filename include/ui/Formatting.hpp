#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <optional>
#include <string>
#include <unordered_map>

namespace xferwatch::ui {

// UTF-8 text width utilities. ANSI CSI sequences occupy no columns.
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);
// Last `cols` columns of s (no escape handling)
std::string tail_cols(const std::string& s, int cols);

// 1024-based units with one decimal: "512.0 B", "1.5 GiB"
std::string format_size(double bytes);
std::string format_speed(double bytes_per_sec);
// H:MM:SS, M:SS, or --:-- when unknown
std::string format_eta(std::optional<double> seconds);

// Left-abbreviate to at most width columns: "...tail of/the/path.mkv"
std::string abbreviate_path(const std::string& path, int width);

// Render-side memo for abbreviate_path. Bounded FIFO; forgets everything when
// the terminal width changes since every entry was cut for the old width.
class PathAbbreviator {
public:
  explicit PathAbbreviator(size_t capacity = 500) : cap_(capacity) {}

  const std::string& get(const std::string& path, int width);
  // Clears the memo when cols differs from the last call
  void set_terminal_width(int cols);
  void clear();

  [[nodiscard]] size_t size() const { return map_.size(); }
  [[nodiscard]] size_t capacity() const { return cap_; }

private:
  size_t cap_;
  int cols_{-1};
  std::unordered_map<std::string, std::string> map_;
  std::deque<std::string> order_;
  std::string scratch_;
};

// "[████░░░░] 50.0%"; width is the number of cells inside the brackets.
// Fill count is truncated toward zero so 99.9% never draws a full bar.
auto progress_bar(double pct, int width, bool unicode = true) -> std::string;

} // namespace xferwatch::ui
