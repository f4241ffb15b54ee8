#pragma once

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xferwatch::util {

// Minimal TOML subset: [sections], key = scalar, key = ["a", "b"] (single line).
// Values are kept as raw strings and converted on access.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (key.empty()) continue;
      ensure_section(current_section).set(key, unquote(val));
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->find(key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find_value(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find_value(section, key);
    if (!v || v->empty()) return def;
    try { return std::stoi(*v); } catch (const std::logic_error&) { return def; }
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* v = find_value(section, key);
    if (!v || v->empty()) return def;
    try { return std::stod(*v); } catch (const std::logic_error&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find_value(section, key);
    if (!v || v->empty()) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

  // ["a", "b", c] -> {a, b, c}. A bare scalar yields a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* v = find_value(section, key);
    if (!v) return out;
    std::string_view sv = trim(*v);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') {
      sv = sv.substr(1, sv.size() - 2);
    }
    while (!sv.empty()) {
      auto comma = sv.find(',');
      auto item = trim(sv.substr(0, comma));
      if (!item.empty()) out.push_back(unquote(std::string(item)));
      if (comma == std::string_view::npos) break;
      sv.remove_prefix(comma + 1);
    }
    return out;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] const std::string* find(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return &v;
      return nullptr;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  [[nodiscard]] const std::string* find_value(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s ? s->find(key) : nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Drop a trailing '# comment' that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string unquote(const std::string& val) {
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
      return val.substr(1, val.size() - 2);
    return val;
  }
};

} // namespace xferwatch::util
