// Small string_view helpers shared by the report parser and config code
#pragma once

#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace glustat::util {

constexpr bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }

[[nodiscard]] std::string_view trim(std::string_view sv);

// Split on runs of whitespace; leading/trailing whitespace yields no empty tokens.
[[nodiscard]] std::vector<std::string_view> split_ws(std::string_view sv);

// Parse a whole token as a double. Accepts an optional leading '+'.
// Returns std::nullopt unless every byte of the token is consumed; `err`
// then receives invalid_argument or result_out_of_range.
[[nodiscard]] std::optional<double> parse_double(std::string_view token, std::errc* err = nullptr);

// FieldParseFailure cause text for a parse_double error
[[nodiscard]] const char* parse_error_cause(std::errc err);

} // namespace glustat::util
