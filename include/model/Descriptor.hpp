#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace xferwatch::model {

// Decoded O_ACCMODE bits of an fdinfo "flags:" field.
enum class AccessMode { ReadOnly, WriteOnly, ReadWrite };

// One open descriptor as seen in a single snapshot. Never retained past a
// classification pass.
struct DescriptorRecord {
  int32_t fd{};
  std::string path;       // absolute, symlink-resolved
  int64_t size{};         // bytes at snapshot time (signed: malformed input stays representable)
  int64_t offset{};       // fdinfo pos:
  AccessMode mode{AccessMode::ReadOnly};
  bool regular_file{true};
};

// Outcome of listing one process's descriptor table. Unavailable covers any
// other failure (EMFILE, ENOMEM, ...) and is retried on the next pass.
enum class ListStatus { Ok, PermissionDenied, NotFound, Unavailable };

inline const char* to_string(AccessMode m) {
  switch (m) {
    case AccessMode::ReadOnly:  return "ro";
    case AccessMode::WriteOnly: return "wo";
    case AccessMode::ReadWrite: return "rw";
  }
  return "?";
}

inline const char* to_string(ListStatus s) {
  switch (s) {
    case ListStatus::Ok:               return "ok";
    case ListStatus::PermissionDenied: return "permission denied";
    case ListStatus::NotFound:         return "process not found";
    case ListStatus::Unavailable:      return "descriptor table unavailable";
  }
  return "?";
}

} // namespace xferwatch::model
