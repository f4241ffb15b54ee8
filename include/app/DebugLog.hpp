#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace xferwatch::app {

// Optional append-only diagnostic sink. A default-constructed log is disabled
// and every call is a no-op. Writes are serialized and flushed per line.
class DebugLog {
public:
  DebugLog() = default;
  explicit DebugLog(std::filesystem::path path);
  ~DebugLog();
  DebugLog(const DebugLog&) = delete;
  DebugLog& operator=(const DebugLog&) = delete;

  // "[YYYY-mm-dd HH:MM:SS.mmm] message"
  void log(const std::string& message);

  [[nodiscard]] bool enabled() const { return file_.is_open(); }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  [[nodiscard]] static std::string timestamp_now();

private:
  std::filesystem::path path_;
  std::ofstream file_;
  std::mutex mu_;
};

} // namespace xferwatch::app
