#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace xferwatch::app {

MonitorConfig default_config() {
  MonitorConfig c{};
  c.managers = {"Sonarr", "Radarr", "Lidarr", "Readarr", "Prowlarr", "Bazarr", "Whisparr"};
  c.ignore_extensions = {".db", ".db-wal", ".db-shm", ".db-journal",
                         ".log", ".txt", ".xml", ".json", ".conf",
                         ".zip", ".dll"};
  return c;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("XFERWATCH_", 0) == 0) {
    alt = std::string("xferwatch_") + n.substr(10);
  } else if (n.rfind("xferwatch_", 0) == 0) {
    alt = std::string("XFERWATCH_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::logic_error&) { return defv; }
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stod(v); } catch (const std::logic_error&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::vector<std::string> split_list(const std::string& s, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find(sep, start);
    if (end == std::string::npos) end = s.size();
    std::string item = s.substr(start, end - start);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.erase(item.begin());
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) item.pop_back();
    if (!item.empty()) out.push_back(std::move(item));
    start = end + 1;
  }
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/xferwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/xferwatch/config.toml";
  return {};
}

static int resolve_int(const xferwatch::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const xferwatch::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const xferwatch::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// TOML array -> comma-separated env -> default
static std::vector<std::string> resolve_list(const xferwatch::util::TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_list(section, key);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v) return split_list(v);
  }
  return def;
}

MonitorConfig load_config(const std::string& path, bool* from_file) {
  const MonitorConfig d = default_config();
  MonitorConfig c = d;
  xferwatch::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (from_file) *from_file = have_toml;

  // --- [monitor] ---
  c.poll_interval_ms     = resolve_int(toml, have_toml, "monitor", "poll_interval_ms", "XFERWATCH_POLL_INTERVAL_MS", d.poll_interval_ms);
  c.poll_interval_ms     = std::clamp(c.poll_interval_ms, 50, 10000);
  c.verbose_log_interval = resolve_int(toml, have_toml, "monitor", "verbose_log_interval", "XFERWATCH_VERBOSE_LOG_INTERVAL", d.verbose_log_interval);
  if (c.verbose_log_interval < 1) c.verbose_log_interval = d.verbose_log_interval;
  c.managers             = resolve_list(toml, have_toml, "monitor", "managers", "XFERWATCH_MANAGERS", d.managers);

  // --- [tracking] ---
  c.expansion_threshold  = resolve_double(toml, have_toml, "tracking", "expansion_threshold", "XFERWATCH_EXPANSION_THRESHOLD", d.expansion_threshold);
  if (!(c.expansion_threshold >= 1.0)) c.expansion_threshold = d.expansion_threshold;
  c.ignore_extensions    = resolve_list(toml, have_toml, "tracking", "ignore_extensions", "XFERWATCH_IGNORE_EXTENSIONS", d.ignore_extensions);

  // --- [cache] ---
  int ep = resolve_int(toml, have_toml, "cache", "episode_capacity", "XFERWATCH_EPISODE_CACHE", static_cast<int>(d.episode_cache_capacity));
  c.episode_cache_capacity = ep < 0 ? d.episode_cache_capacity : static_cast<size_t>(ep);
  int pc = resolve_int(toml, have_toml, "cache", "path_capacity", "XFERWATCH_PATH_CACHE", static_cast<int>(d.path_cache_capacity));
  c.path_cache_capacity = pc < 0 ? d.path_cache_capacity : static_cast<size_t>(pc);

  // --- [ui] ---
  c.alt_screen = resolve_bool(toml, have_toml, "ui", "alt_screen", "XFERWATCH_ALT_SCREEN", d.alt_screen);

  return c;
}

} // namespace xferwatch::app
