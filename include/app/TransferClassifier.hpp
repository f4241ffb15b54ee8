#pragma once
#include "model/Descriptor.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace xferwatch::app {

struct SourceCandidate {
  std::string filename;
  int64_t size{};
  std::string path;
};

struct DestinationCandidate {
  int32_t fd{};
  std::string path;
  int64_t size{};
};

// filename -> candidate; last descriptor wins on duplicate names
using SourceMap = std::unordered_map<std::string, SourceCandidate>;

// Lowercase, dot-prefixed extensions (".db", ".db-wal", ...)
using ExtensionSet = std::unordered_set<std::string>;

struct Classification {
  SourceMap sources;
  std::vector<DestinationCandidate> destinations;
};

// "DB", "db", ".Db" -> ".db"; empty stays empty
[[nodiscard]] std::string normalize_extension(const std::string& ext);
[[nodiscard]] ExtensionSet make_extension_set(const std::vector<std::string>& exts);

// Final path component
[[nodiscard]] std::string base_name(const std::string& path);

// True if the final component's extension (case-insensitive) is in ignore
[[nodiscard]] bool is_ignored(const std::string& path, const ExtensionSet& ignore);

// Split one process's descriptors into read sources and write destinations.
// Non-regular files are dropped on both sides. The ignore set only filters
// destinations; read-only regular files are always sources.
[[nodiscard]] Classification classify(const std::vector<model::DescriptorRecord>& records,
                                      const ExtensionSet& ignore);

} // namespace xferwatch::app
