#include "ui/Formatting.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace xferwatch::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string tail_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  // Code point start offsets; the tail begins at one of them
  std::vector<size_t> starts;
  starts.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    starts.push_back(i);
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    i += len;
  }
  if ((int)starts.size() <= cols) return s;
  return s.substr(starts[starts.size() - (size_t)cols]);
}

std::string format_size(double bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  char buf[48];
  for (const char* u : units) {
    if (bytes < 1024.0) {
      std::snprintf(buf, sizeof(buf), "%.1f %s", bytes, u);
      return buf;
    }
    bytes /= 1024.0;
  }
  std::snprintf(buf, sizeof(buf), "%.1f PiB", bytes);
  return buf;
}

std::string format_speed(double bytes_per_sec) {
  return format_size(bytes_per_sec) + "/s";
}

std::string format_eta(std::optional<double> seconds) {
  if (!seconds || !std::isfinite(*seconds) || *seconds < 0) return "--:--";
  auto total = static_cast<uint64_t>(*seconds);
  uint64_t h = total / 3600;
  uint64_t m = (total % 3600) / 60;
  uint64_t s = total % 60;
  char buf[48];
  if (h > 0)
    std::snprintf(buf, sizeof(buf), "%llu:%02llu:%02llu", (unsigned long long)h, (unsigned long long)m, (unsigned long long)s);
  else
    std::snprintf(buf, sizeof(buf), "%llu:%02llu", (unsigned long long)m, (unsigned long long)s);
  return buf;
}

std::string abbreviate_path(const std::string& path, int width) {
  if (width <= 0) return "";
  if (display_cols(path) <= width) return path;
  if (width <= 3) return std::string("...").substr(0, (size_t)width);
  return "..." + tail_cols(path, width - 3);
}

const std::string& PathAbbreviator::get(const std::string& path, int width) {
  std::string key = std::to_string(width);
  key.push_back('\0');
  key += path;
  auto it = map_.find(key);
  if (it != map_.end()) return it->second;
  if (cap_ == 0) {
    scratch_ = abbreviate_path(path, width);
    return scratch_;
  }
  while (map_.size() >= cap_ && !order_.empty()) {
    map_.erase(order_.front());
    order_.pop_front();
  }
  order_.push_back(key);
  return map_.emplace(std::move(key), abbreviate_path(path, width)).first->second;
}

void PathAbbreviator::set_terminal_width(int cols) {
  if (cols != cols_) {
    clear();
    cols_ = cols;
  }
}

void PathAbbreviator::clear() {
  map_.clear();
  order_.clear();
}

auto progress_bar(double pct, int width, bool unicode) -> std::string {
  if (!std::isfinite(pct)) pct = 0.0;
  pct = std::clamp(pct, 0.0, 100.0);
  if (width < 0) width = 0;
  int filled = static_cast<int>((pct / 100.0) * width);
  if (filled > width) filled = width;
  const char* fill = unicode ? "\xE2\x96\x88" : "#";   // U+2588
  const char* track = unicode ? "\xE2\x96\x91" : "-";  // U+2591
  std::string s;
  s.reserve((size_t)width * 3 + 12);
  s.push_back('[');
  for (int i = 0; i < width; ++i) s += (i < filled) ? fill : track;
  s.push_back(']');
  char buf[16];
  std::snprintf(buf, sizeof(buf), " %.1f%%", pct);
  s += buf;
  return s;
}

} // namespace xferwatch::ui
