#include "collectors/ProcfsDescriptorSource.hpp"
#include "util/Procfs.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace xferwatch::collectors {

using model::AccessMode;
using model::DescriptorRecord;
using model::ListStatus;

std::optional<ProcfsDescriptorSource::FdinfoFields> ProcfsDescriptorSource::parse_fdinfo(const std::string& txt) {
  FdinfoFields f{};
  bool have_pos = false, have_flags = false;
  std::istringstream ss(txt);
  std::string line;
  auto value_of = [](const std::string& l, size_t key_len) {
    size_t start = key_len;
    while (start < l.size() && (l[start] == ' ' || l[start] == '\t')) ++start;
    size_t end = start;
    while (end < l.size() && l[end] >= '0' && l[end] <= '9') ++end;
    return std::make_pair(start, end);
  };
  while (std::getline(ss, line)) {
    if (line.rfind("pos:", 0) == 0) {
      auto [s, e] = value_of(line, 4);
      if (e == s) return std::nullopt;
      auto r = std::from_chars(line.data() + s, line.data() + e, f.pos, 10);
      if (r.ec != std::errc()) return std::nullopt;
      have_pos = true;
    } else if (line.rfind("flags:", 0) == 0) {
      auto [s, e] = value_of(line, 6);
      if (e == s) return std::nullopt;
      auto r = std::from_chars(line.data() + s, line.data() + e, f.flags, 8);
      if (r.ec != std::errc()) return std::nullopt;
      have_flags = true;
    }
    if (have_pos && have_flags) break;
  }
  if (!have_pos || !have_flags) return std::nullopt;
  return f;
}

std::optional<AccessMode> ProcfsDescriptorSource::access_mode_from_flags(unsigned flags) {
  switch (flags & 03u) {
    case 0: return AccessMode::ReadOnly;
    case 1: return AccessMode::WriteOnly;
    case 2: return AccessMode::ReadWrite;
    default: return std::nullopt;
  }
}

ListStatus ProcfsDescriptorSource::status_from_errno(int err) {
  switch (err) {
    case 0: return ListStatus::Ok;
    case EACCES:
    case EPERM: return ListStatus::PermissionDenied;
    case ENOENT:
    case ESRCH: return ListStatus::NotFound;
    default: return ListStatus::Unavailable;
  }
}

ListStatus ProcfsDescriptorSource::list(int32_t pid, std::vector<DescriptorRecord>& out) {
  out.clear();
  skipped_ = 0;
  const std::string base = std::string("/proc/") + std::to_string(pid);
  const std::string fd_dir = base + "/fd";
  const std::string fdinfo_dir = base + "/fdinfo";

  int err = 0;
  auto fds = xferwatch::util::list_dir(fd_dir, &err);
  if (auto st = status_from_errno(err); st != ListStatus::Ok) return st;

  out.reserve(fds.size());
  for (const auto& fn : fds) {
    if (!xferwatch::util::is_number(fn)) continue;
    auto target = xferwatch::util::read_symlink(fd_dir + "/" + fn);
    if (!target) { ++skipped_; continue; }
    // socket:[..], pipe:[..], anon_inode:.. are not files
    if (target->empty() || target->front() != '/') continue;

    struct stat st{};
    if (::stat(target->c_str(), &st) != 0) { ++skipped_; continue; }

    auto info_txt = xferwatch::util::read_file_string(fdinfo_dir + "/" + fn);
    if (!info_txt) { ++skipped_; continue; }
    auto fields = parse_fdinfo(*info_txt);
    if (!fields) { ++skipped_; continue; }
    auto mode = access_mode_from_flags(fields->flags);
    if (!mode) { ++skipped_; continue; }

    DescriptorRecord rec;
    rec.fd = static_cast<int32_t>(std::strtol(fn.c_str(), nullptr, 10));
    rec.path = std::move(*target);
    rec.size = static_cast<int64_t>(st.st_size);
    rec.offset = fields->pos;
    rec.mode = *mode;
    rec.regular_file = S_ISREG(st.st_mode);
    out.push_back(std::move(rec));
  }
  return ListStatus::Ok;
}

} // namespace xferwatch::collectors
