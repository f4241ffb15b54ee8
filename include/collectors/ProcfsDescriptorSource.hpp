#pragma once
#include "collectors/IDescriptorSource.hpp"
#include <optional>
#include <string>

namespace xferwatch::collectors {

// Descriptor listing from /proc/<pid>/fd and /proc/<pid>/fdinfo.
// - fd/<n> symlinks resolve to the open path; non-path targets (socket:[..],
//   pipe:[..], anon_inode:..) are dropped.
// - stat() on the target supplies size and file type.
// - fdinfo/<n> supplies "pos:" (decimal) and "flags:" (octal, O_ACCMODE in the
//   low two bits).
class ProcfsDescriptorSource : public IDescriptorSource {
public:
  struct FdinfoFields { int64_t pos{0}; unsigned flags{0}; };

  [[nodiscard]] model::ListStatus list(int32_t pid, std::vector<model::DescriptorRecord>& out) override;
  [[nodiscard]] size_t last_skipped() const override { return skipped_; }
  [[nodiscard]] const char* name() const override { return "/proc fd scanner"; }

  // Parse fdinfo text; std::nullopt if either field is missing or malformed
  [[nodiscard]] static std::optional<FdinfoFields> parse_fdinfo(const std::string& txt);
  // Map an opendir errno on /proc/<pid>/fd. Only ENOENT/ESRCH mean the
  // process is gone.
  [[nodiscard]] static model::ListStatus status_from_errno(int err);
  // Map O_ACCMODE bits; std::nullopt for the invalid value 3
  [[nodiscard]] static std::optional<model::AccessMode> access_mode_from_flags(unsigned flags);

private:
  size_t skipped_{0};
};

} // namespace xferwatch::collectors
