#pragma once
#include <string>
#include <string_view>

namespace xferwatch::util {

// Locale-independent lowercase for ASCII; other bytes (UTF-8 included) pass through
constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

// ascii_lower plus the UTF-8 Latin-1 capitals U+00C0..U+00DE (except U+00D7),
// encoded C3 80..9E and folded to C3 A0..BE. Other scripts pass through.
inline std::string fold_case_latin1(std::string_view s) {
  std::string out = ascii_lower(s);
  for (size_t i = 0; i + 1 < out.size(); ++i) {
    if (static_cast<unsigned char>(out[i]) != 0xC3) continue;
    auto c = static_cast<unsigned char>(out[i + 1]);
    if (c >= 0x80 && c <= 0x9E && c != 0x97) out[i + 1] = static_cast<char>(c + 0x20);
    ++i;
  }
  return out;
}

} // namespace xferwatch::util
