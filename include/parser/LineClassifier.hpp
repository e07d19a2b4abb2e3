#pragma once
#include <string_view>

namespace glustat::parser {

enum class LineKind { BrickHeader, ReadBytes, WriteBytes, FopCandidate, NoMatch };

// Result of classifying one report line. `value` views into the input line:
// the brick id for BrickHeader, the digit run for ReadBytes/WriteBytes,
// and the trimmed line for FopCandidate.
struct LineMatch {
  LineKind kind{LineKind::NoMatch};
  std::string_view value{};
};

// First match wins: brick header, data read, data written, fop candidate.
[[nodiscard]] LineMatch classify_line(std::string_view line);

} // namespace glustat::parser
