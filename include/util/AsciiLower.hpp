#pragma once

#include <array>
#include <string>
#include <string_view>

namespace glustat::util {

namespace detail {
constexpr std::array<unsigned char, 256> make_lower_table() {
  std::array<unsigned char, 256> t{};
  for (int c = 0; c < 256; ++c) {
    t[c] = (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c - 'A' + 'a')
                                  : static_cast<unsigned char>(c);
  }
  return t;
}
inline constexpr auto kLowerTable = make_lower_table();
} // namespace detail

// Locale-independent lower-casing (ASCII only)
constexpr unsigned char ascii_lower(unsigned char c) { return detail::kLowerTable[c]; }

inline std::string ascii_lower_copy(std::string_view sv) {
  std::string out(sv);
  for (auto& c : out) c = static_cast<char>(ascii_lower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace glustat::util
