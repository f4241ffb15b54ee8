#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace xferwatch::app;

namespace {

const char* kVars[] = {
  "XFERWATCH_POLL_INTERVAL_MS", "XFERWATCH_VERBOSE_LOG_INTERVAL", "XFERWATCH_MANAGERS",
  "XFERWATCH_EXPANSION_THRESHOLD", "XFERWATCH_IGNORE_EXTENSIONS", "XFERWATCH_EPISODE_CACHE",
  "XFERWATCH_PATH_CACHE", "XFERWATCH_ALT_SCREEN", "xferwatch_POLL_INTERVAL_MS",
};

struct CleanEnv {
  CleanEnv() { for (auto* v : kVars) ::unsetenv(v); }
  ~CleanEnv() { for (auto* v : kVars) ::unsetenv(v); }
};

std::string write_toml(const char* tag, const std::string& body) {
  auto p = std::string("/tmp/xferwatch_test_config_") + tag + "_" + std::to_string(::getpid()) + ".toml";
  std::ofstream(p) << body;
  return p;
}

void remove_file(const std::string& p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
}

} // namespace

TEST(config_defaults) {
  CleanEnv env;
  bool from_file = true;
  auto c = load_config("", &from_file);
  ASSERT_TRUE(!from_file);
  ASSERT_EQ(c.poll_interval_ms, 500);
  ASSERT_EQ(c.verbose_log_interval, 100);
  ASSERT_NEAR(c.expansion_threshold, 1.1, 1e-12);
  ASSERT_EQ(c.episode_cache_capacity, (size_t)1000);
  ASSERT_EQ(c.path_cache_capacity, (size_t)500);
  ASSERT_TRUE(c.alt_screen);
  ASSERT_EQ(c.managers.size(), (size_t)7);
  ASSERT_EQ(c.managers.front(), "Sonarr");
  ASSERT_EQ(c.ignore_extensions.size(), (size_t)11);
}

TEST(config_toml_overrides_defaults) {
  CleanEnv env;
  auto p = write_toml("file",
    "[monitor]\n"
    "poll_interval_ms = 1000\n"
    "managers = [\"Sonarr\", \"Custom\"]\n"
    "[tracking]\n"
    "expansion_threshold = 1.5\n"
    "ignore_extensions = [\".nfo\"]\n"
    "[cache]\n"
    "episode_capacity = 10\n"
    "path_capacity = 0\n"
    "[ui]\n"
    "alt_screen = false\n");
  bool from_file = false;
  auto c = load_config(p, &from_file);
  ASSERT_TRUE(from_file);
  ASSERT_EQ(c.poll_interval_ms, 1000);
  ASSERT_EQ(c.managers.size(), (size_t)2);
  ASSERT_EQ(c.managers[1], "Custom");
  ASSERT_NEAR(c.expansion_threshold, 1.5, 1e-12);
  ASSERT_EQ(c.ignore_extensions.size(), (size_t)1);
  ASSERT_EQ(c.episode_cache_capacity, (size_t)10);
  ASSERT_EQ(c.path_cache_capacity, (size_t)0);
  ASSERT_TRUE(!c.alt_screen);
  remove_file(p);
}

TEST(config_env_used_when_toml_silent) {
  CleanEnv env;
  auto p = write_toml("env", "[monitor]\npoll_interval_ms = 800\n");
  ::setenv("XFERWATCH_POLL_INTERVAL_MS", "300", 1);
  ::setenv("XFERWATCH_MANAGERS", "Sonarr, Radarr,,", 1);
  ::setenv("XFERWATCH_EXPANSION_THRESHOLD", "1.3", 1);
  ::setenv("XFERWATCH_ALT_SCREEN", "0", 1);
  auto c = load_config(p);
  ASSERT_EQ(c.poll_interval_ms, 800);   // file wins
  ASSERT_EQ(c.managers.size(), (size_t)2);
  ASSERT_EQ(c.managers[1], "Radarr");
  ASSERT_NEAR(c.expansion_threshold, 1.3, 1e-12);
  ASSERT_TRUE(!c.alt_screen);
  remove_file(p);
}

TEST(config_invalid_values_fall_back) {
  CleanEnv env;
  ::setenv("XFERWATCH_POLL_INTERVAL_MS", "5", 1);
  ::setenv("XFERWATCH_EXPANSION_THRESHOLD", "0.9", 1);
  ::setenv("XFERWATCH_VERBOSE_LOG_INTERVAL", "0", 1);
  ::setenv("XFERWATCH_EPISODE_CACHE", "-4", 1);
  auto c = load_config("");
  ASSERT_EQ(c.poll_interval_ms, 50);
  ASSERT_NEAR(c.expansion_threshold, 1.1, 1e-12);
  ASSERT_EQ(c.verbose_log_interval, 100);
  ASSERT_EQ(c.episode_cache_capacity, (size_t)1000);
}

TEST(config_env_lowercase_alias) {
  CleanEnv env;
  ::setenv("xferwatch_POLL_INTERVAL_MS", "700", 1);
  ASSERT_EQ(getenv_int("XFERWATCH_POLL_INTERVAL_MS", 1), 700);
  ASSERT_EQ(load_config("").poll_interval_ms, 700);
}

TEST(config_split_list) {
  auto v = split_list(" .nfo, .srt ,,.jpg ");
  ASSERT_EQ(v.size(), (size_t)3);
  ASSERT_EQ(v[0], ".nfo");
  ASSERT_EQ(v[1], ".srt");
  ASSERT_EQ(v[2], ".jpg");
  ASSERT_TRUE(split_list("").empty());
}

TEST(config_file_path_prefers_xdg) {
  const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old_xdg ? old_xdg : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdgtest", 1);
  ASSERT_EQ(config_file_path(), "/tmp/xdgtest/xferwatch/config.toml");
  if (old_xdg) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME");
}
