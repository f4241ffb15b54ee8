#include "app/SourceMatcher.hpp"
#include "util/AsciiLower.hpp"

#include <algorithm>
#include <vector>

namespace xferwatch::app {

using model::MatchMethod;

static std::vector<const SourceCandidate*> by_path(const SourceMap& sources) {
  std::vector<const SourceCandidate*> v;
  v.reserve(sources.size());
  for (const auto& kv : sources) v.push_back(&kv.second);
  std::sort(v.begin(), v.end(), [](const SourceCandidate* a, const SourceCandidate* b){ return a->path < b->path; });
  return v;
}

SourceMatch match_source(const std::string& dest_filename, int64_t dest_size,
                         const SourceMap& sources, EpisodeCache& cache) {
  if (sources.empty()) {
    return SourceMatch{std::max<int64_t>(dest_size, 1), std::nullopt, MatchMethod::Fallback};
  }
  auto ordered = by_path(sources);

  const auto dest_folded = xferwatch::util::fold_case_latin1(dest_filename);
  for (const auto* src : ordered) {
    if (xferwatch::util::fold_case_latin1(src->filename) == dest_folded) {
      return SourceMatch{src->size, src->path, MatchMethod::Exact};
    }
  }

  if (auto dest_ep = cache.get_or_compute(dest_filename)) {
    for (const auto* src : ordered) {
      auto src_ep = cache.get_or_compute(src->filename);
      if (src_ep && *src_ep == *dest_ep) {
        return SourceMatch{src->size, src->path, MatchMethod::Episode};
      }
    }
  }

  int64_t largest = ordered.front()->size;
  for (const auto* src : ordered) largest = std::max(largest, src->size);
  return SourceMatch{largest, std::nullopt, MatchMethod::Largest};
}

} // namespace xferwatch::app
