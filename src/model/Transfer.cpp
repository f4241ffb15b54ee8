#include "model/Transfer.hpp"

#include <algorithm>
#include <filesystem>

namespace xferwatch::model {

double TransferRecord::percent() const {
  if (target_size <= 0) return 0.0;
  double pct = (static_cast<double>(position) / static_cast<double>(target_size)) * 100.0;
  return std::clamp(pct, 0.0, 100.0);
}

std::optional<double> TransferRecord::eta_seconds() const {
  if (throughput > 0.0 && target_size > position) {
    return static_cast<double>(target_size - position) / throughput;
  }
  return std::nullopt;
}

std::string TransferRecord::filename() const {
  return std::filesystem::path(path).filename().string();
}

} // namespace xferwatch::model
