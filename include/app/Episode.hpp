#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace xferwatch::app {

// (season, episode) parsed from a filename; only ever used as a matching key
struct EpisodeKey {
  uint32_t season{};
  uint32_t episode{};
  bool operator==(const EpisodeKey& o) const { return season == o.season && episode == o.episode; }
  bool operator!=(const EpisodeKey& o) const { return !(*this == o); }
};

// Tries, in order: S01E05, 1x05, "Season 1 ... Episode 5". First hit wins.
// Digits are taken as written (no zero-padding normalization beyond the
// integer value). std::nullopt when nothing matches.
[[nodiscard]] std::optional<EpisodeKey> extract_episode_key(const std::string& filename);

} // namespace xferwatch::app
