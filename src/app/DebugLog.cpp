#include "app/DebugLog.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

namespace xferwatch::app {

DebugLog::DebugLog(std::filesystem::path path) : path_(std::move(path)) {
  file_.open(path_, std::ios::out | std::ios::trunc);
  if (!file_) {
    std::fprintf(stderr, "xferwatch: DebugLog: could not create %s: %s\n",
                 path_.c_str(), std::strerror(errno));
    return;
  }
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  file_ << "=== xferwatch debug log - " << buf << " ===\n\n";
  file_.flush();
}

DebugLog::~DebugLog() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

std::string DebugLog::timestamp_now() {
  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

void DebugLog::log(const std::string& message) {
  if (!file_.is_open()) return;
  auto ts = timestamp_now();
  std::lock_guard<std::mutex> lk(mu_);
  file_ << '[' << ts << "] " << message << '\n';
  file_.flush();
  // A failed write leaves the stream in a bad state; reset so later lines can retry
  if (!file_) file_.clear();
}

} // namespace xferwatch::app
