#include "collectors/ProcessScanner.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cstdlib>

namespace xferwatch::collectors {

static std::string read_comm(int32_t pid) {
  auto txt = xferwatch::util::read_file_string(std::string("/proc/") + std::to_string(pid) + "/comm");
  if (!txt) return {};
  std::string s = *txt;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

std::vector<ProcessEntry> find_manager_processes(const std::vector<std::string>& names) {
  std::vector<ProcessEntry> out;
  for (const auto& pd : xferwatch::util::list_dir("/proc")) {
    if (!xferwatch::util::is_number(pd)) continue;
    int32_t pid = static_cast<int32_t>(std::strtol(pd.c_str(), nullptr, 10));
    // Process may exit between readdir and read; an empty comm just won't match
    auto comm = read_comm(pid);
    if (comm.empty()) continue;
    if (std::find(names.begin(), names.end(), comm) != names.end()) {
      out.push_back(ProcessEntry{pid, std::move(comm)});
    }
  }
  std::sort(out.begin(), out.end(), [](const ProcessEntry& a, const ProcessEntry& b){ return a.pid < b.pid; });
  return out;
}

std::string process_name(int32_t pid) {
  auto comm = read_comm(pid);
  if (comm.empty()) return "PID " + std::to_string(pid);
  return comm;
}

bool process_exists(int32_t pid) {
  if (pid <= 0) return false;
  return xferwatch::util::path_exists(std::string("/proc/") + std::to_string(pid));
}

} // namespace xferwatch::collectors
