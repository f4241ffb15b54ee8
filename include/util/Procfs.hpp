// Helpers for reading /proc with an optional root remap
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace xferwatch::util {

// Map an absolute /proc path to an alternate root if XFERWATCH_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error; when
// err is given it receives errno of the failed opendir (0 on success).
auto list_dir(const std::string& abs, int* err = nullptr) -> std::vector<std::string>;

// Read a symlink's target without following further links. std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// True if the (remapped) path exists
auto path_exists(const std::string& abs) -> bool;

// All-digit name check for /proc/<pid> and fd directory entries
auto is_number(const std::string& s) -> bool;

} // namespace xferwatch::util
