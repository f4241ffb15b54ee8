#pragma once
#include "model/Descriptor.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace xferwatch::collectors {

// Snapshot provider for a process's open descriptors. The /proc scanner is the
// production implementation; tests substitute scripted sources.
class IDescriptorSource {
public:
  virtual ~IDescriptorSource() = default;

  // Replace out with the current descriptors of pid. Descriptors that vanish or
  // cannot be inspected mid-scan are left out; a failure to read the table as a
  // whole is reported through the status and leaves out empty.
  [[nodiscard]] virtual model::ListStatus list(int32_t pid, std::vector<model::DescriptorRecord>& out) = 0;

  // Descriptors dropped during the most recent list() call
  [[nodiscard]] virtual size_t last_skipped() const { return 0; }

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace xferwatch::collectors
