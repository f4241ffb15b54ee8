#include "app/TransferClassifier.hpp"
#include "util/AsciiLower.hpp"

#include <filesystem>

namespace xferwatch::app {

std::string normalize_extension(const std::string& ext) {
  if (ext.empty()) return {};
  auto lower = xferwatch::util::ascii_lower(ext);
  if (lower.front() != '.') lower.insert(lower.begin(), '.');
  return lower;
}

ExtensionSet make_extension_set(const std::vector<std::string>& exts) {
  ExtensionSet out;
  for (const auto& e : exts) {
    auto n = normalize_extension(e);
    if (!n.empty()) out.insert(std::move(n));
  }
  return out;
}

std::string base_name(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

bool is_ignored(const std::string& path, const ExtensionSet& ignore) {
  if (ignore.empty()) return false;
  // ".bashrc" has no extension; "a.tar.gz" -> ".gz"
  auto ext = std::filesystem::path(path).filename().extension().string();
  if (ext.empty()) return false;
  return ignore.count(xferwatch::util::ascii_lower(ext)) != 0;
}

Classification classify(const std::vector<model::DescriptorRecord>& records, const ExtensionSet& ignore) {
  Classification out;
  for (const auto& r : records) {
    // Devices, FIFOs and directories are never part of a copy
    if (r.path.empty() || !r.regular_file) continue;
    if (r.mode == model::AccessMode::ReadOnly) {
      auto name = base_name(r.path);
      out.sources[name] = SourceCandidate{name, r.size, r.path};
      continue;
    }
    // WriteOnly / ReadWrite
    if (is_ignored(r.path, ignore)) continue;
    out.destinations.push_back(DestinationCandidate{r.fd, r.path, r.size});
  }
  return out;
}

} // namespace xferwatch::app
