#include "minitest.hpp"
#include "app/DebugLog.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using xferwatch::app::DebugLog;

static std::vector<std::string> read_lines(const std::string& p) {
  std::vector<std::string> out;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

TEST(debug_log_disabled_is_noop) {
  DebugLog log;
  ASSERT_TRUE(!log.enabled());
  log.log("nothing happens");
}

TEST(debug_log_header_and_line_format) {
  auto path = std::string("/tmp/xferwatch_test_debuglog_") + std::to_string(::getpid()) + ".log";
  {
    DebugLog log(path);
    ASSERT_TRUE(log.enabled());
    log.log("hello");
  }
  auto lines = read_lines(path);
  ASSERT_TRUE(lines.size() >= 3);
  ASSERT_EQ(lines[0].rfind("=== xferwatch debug log - ", 0), (size_t)0);
  ASSERT_EQ(lines[1], "");
  // [YYYY-mm-dd HH:MM:SS.mmm] hello
  const auto& l = lines[2];
  ASSERT_EQ(l.size(), (size_t)(1 + 23 + 2 + 5));
  ASSERT_EQ(l[0], '[');
  ASSERT_EQ(l[11], ' ');
  ASSERT_EQ(l[20], '.');
  ASSERT_EQ(l.substr(24), "] hello");
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(debug_log_truncates_previous_run) {
  auto path = std::string("/tmp/xferwatch_test_debuglog_trunc_") + std::to_string(::getpid()) + ".log";
  { DebugLog a(path); a.log("first run"); }
  { DebugLog b(path); b.log("second run"); }
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), (size_t)3);
  ASSERT_TRUE(lines[2].find("second run") != std::string::npos);
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(debug_log_concurrent_lines_stay_whole) {
  auto path = std::string("/tmp/xferwatch_test_debuglog_mt_") + std::to_string(::getpid()) + ".log";
  {
    DebugLog log(path);
    std::vector<std::thread> ts;
    for (int t = 0; t < 4; ++t) {
      ts.emplace_back([&log, t]{
        for (int i = 0; i < 50; ++i) log.log("thread " + std::to_string(t) + " line " + std::to_string(i));
      });
    }
    for (auto& th : ts) th.join();
  }
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), (size_t)(2 + 200));
  for (size_t i = 2; i < lines.size(); ++i) {
    ASSERT_EQ(lines[i][0], '[');
    ASSERT_TRUE(lines[i].find("] thread ") == 24);
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(debug_log_unwritable_path_stays_disabled) {
  DebugLog log("/nonexistent_dir_xferwatch/sub/log.txt");
  ASSERT_TRUE(!log.enabled());
  log.log("dropped");
}
