#include "app/Episode.hpp"

#include <array>
#include <charconv>
#include <regex>

namespace xferwatch::app {

static bool to_u32(const std::ssub_match& m, uint32_t& out) {
  if (!m.matched) return false;
  const char* first = &*m.first;
  const char* last = first + m.length();
  auto r = std::from_chars(first, last, out, 10);
  return r.ec == std::errc() && r.ptr == last;
}

std::optional<EpisodeKey> extract_episode_key(const std::string& filename) {
  static const std::array<std::regex, 3> patterns{
    std::regex(R"([Ss](\d+)[Ee](\d+))"),
    std::regex(R"((\d+)[xX](\d+))"),
    std::regex(R"([Ss]eason\s*(\d+).*[Ee]pisode\s*(\d+))"),
  };
  std::smatch m;
  for (const auto& re : patterns) {
    if (!std::regex_search(filename, m, re)) continue;
    EpisodeKey k{};
    // Numbers too large for 32 bits are not an episode encoding; try the next form
    if (!to_u32(m[1], k.season) || !to_u32(m[2], k.episode)) continue;
    return k;
  }
  return std::nullopt;
}

} // namespace xferwatch::app
