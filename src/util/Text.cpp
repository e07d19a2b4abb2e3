#include "util/Text.hpp"

#include <charconv>
#include <system_error>

namespace glustat::util {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return sv;
}

std::vector<std::string_view> split_ws(std::string_view sv) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && is_space(sv[i])) ++i;
    size_t start = i;
    while (i < sv.size() && !is_space(sv[i])) ++i;
    if (i > start) out.push_back(sv.substr(start, i - start));
  }
  return out;
}

std::optional<double> parse_double(std::string_view token, std::errc* err) {
  auto fail = [err](std::errc ec) -> std::optional<double> {
    if (err) *err = ec;
    return std::nullopt;
  };
  if (!token.empty() && token.front() == '+') token.remove_prefix(1);
  if (token.empty()) return fail(std::errc::invalid_argument);
  double v = 0.0;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{}) return fail(ec);
  if (ptr != last) return fail(std::errc::invalid_argument);
  return v;
}

const char* parse_error_cause(std::errc err) {
  return err == std::errc::result_out_of_range ? "out of range" : "invalid number";
}

} // namespace glustat::util
