#pragma once
#include "app/EpisodeCache.hpp"
#include "app/TransferClassifier.hpp"
#include "model/Transfer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace xferwatch::app {

struct SourceMatch {
  int64_t target_size{1};
  std::optional<std::string> source_path;
  model::MatchMethod method{model::MatchMethod::Fallback};
};

// Pick the most plausible source for one destination and its expected final
// size. Priority:
//   1. exact filename, case-insensitive over ASCII and Latin-1 letters
//   2. equal episode key (via cache)
//   3. largest open source, provenance unknown (no source_path)
//   4. max(dest_size, 1) when the process reads nothing
// Candidates of equal standing are visited in ascending source path order and
// the first one wins. Never fails.
[[nodiscard]] SourceMatch match_source(const std::string& dest_filename, int64_t dest_size,
                                       const SourceMap& sources, EpisodeCache& cache);

} // namespace xferwatch::app
