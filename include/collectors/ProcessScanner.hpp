#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace xferwatch::collectors {

struct ProcessEntry {
  int32_t pid{};
  std::string name;
};

// Processes whose /proc/<pid>/comm equals one of names (exact, case-sensitive),
// ordered by pid.
[[nodiscard]] std::vector<ProcessEntry> find_manager_processes(const std::vector<std::string>& names);

// comm of pid, or "PID <pid>" when unreadable
[[nodiscard]] std::string process_name(int32_t pid);

[[nodiscard]] bool process_exists(int32_t pid);

} // namespace xferwatch::collectors
