#include "parser/LineClassifier.hpp"
#include "util/Text.hpp"

namespace glustat::parser {

using glustat::util::is_digit;

static constexpr std::string_view kBrickPrefix = "Brick: ";
static constexpr std::string_view kReadKeyword = "Data Read: ";
static constexpr std::string_view kWriteKeyword = "Data Written: ";
static constexpr std::string_view kBytesSuffix = " bytes";

// "<anything><keyword><digits> bytes" anchored at end of line; returns the digit run
static bool match_byte_counter(std::string_view line, std::string_view keyword, std::string_view& digits) {
  if (!line.ends_with(kBytesSuffix)) return false;
  line.remove_suffix(kBytesSuffix.size());
  size_t end = line.size();
  size_t start = end;
  while (start > 0 && is_digit(line[start - 1])) --start;
  if (start == end) return false;
  if (!line.substr(0, start).ends_with(keyword)) return false;
  digits = line.substr(start, end - start);
  return true;
}

// Weak pre-filter: "<digits>.<digits>" at the start of the trimmed line
static bool looks_like_fop(std::string_view trimmed) {
  size_t i = 0;
  while (i < trimmed.size() && is_digit(trimmed[i])) ++i;
  if (i == 0 || i >= trimmed.size() || trimmed[i] != '.') return false;
  ++i;
  return i < trimmed.size() && is_digit(trimmed[i]);
}

LineMatch classify_line(std::string_view line) {
  if (line.starts_with(kBrickPrefix)) {
    return {LineKind::BrickHeader, line.substr(kBrickPrefix.size())};
  }
  std::string_view digits;
  if (match_byte_counter(line, kReadKeyword, digits)) return {LineKind::ReadBytes, digits};
  if (match_byte_counter(line, kWriteKeyword, digits)) return {LineKind::WriteBytes, digits};
  auto trimmed = glustat::util::trim(line);
  if (looks_like_fop(trimmed)) return {LineKind::FopCandidate, trimmed};
  return {};
}

} // namespace glustat::parser
