#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace xferwatch::app {

// Static settings handed to the monitor; never re-derived by the core
struct MonitorConfig {
  int poll_interval_ms{500};
  int verbose_log_interval{100};   // verbose scan every N polls (and on the first)
  std::vector<std::string> managers;
  double expansion_threshold{1.1};
  std::vector<std::string> ignore_extensions;
  size_t episode_cache_capacity{1000};
  size_t path_cache_capacity{500};  // display-side abbreviation cache
  bool alt_screen{true};
};

[[nodiscard]] MonitorConfig default_config();

// $XDG_CONFIG_HOME/xferwatch/config.toml, else ~/.config/xferwatch/config.toml
[[nodiscard]] std::string config_file_path();

// Resolve every setting TOML -> env -> compiled default. An empty or missing
// path skips the TOML layer; from_file reports whether a file was read.
[[nodiscard]] MonitorConfig load_config(const std::string& path, bool* from_file = nullptr);

// Environment helpers (XFERWATCH_FOO also answers to xferwatch_FOO)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);
bool env_flag(const char* name, bool defv);

// "a, b,,c" -> {a, b, c}
[[nodiscard]] std::vector<std::string> split_list(const std::string& s, char sep = ',');

} // namespace xferwatch::app
