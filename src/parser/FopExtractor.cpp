#include "parser/FopExtractor.hpp"
#include "util/AsciiLower.hpp"
#include "util/Text.hpp"

namespace glustat::parser {

namespace {

struct FopColumn {
  size_t index;
  const char* label;
};

// Tokens 2, 4 and 6 are unit suffixes ("us") and are not read.
constexpr FopColumn kColumns[] = {
  {0, "pct_latency"},
  {1, "avg_latency"},
  {3, "min_latency"},
  {5, "max_latency"},
  {7, "ncalls"},
};

constexpr size_t kOpIndex = 8;

} // anonymous namespace

std::optional<FopRecord> extract_fop(std::string_view trimmed_line) {
  auto tokens = glustat::util::split_ws(trimmed_line);
  if (tokens.size() != kFopTokenCount) return std::nullopt;

  FopRecord rec;
  rec.op = glustat::util::ascii_lower_copy(tokens[kOpIndex]);
  for (const auto& col : kColumns) {
    std::string_view tok = tokens[col.index];
    std::errc err{};
    if (auto v = glustat::util::parse_double(tok, &err)) {
      rec.fields[rec.op + "_" + col.label] = *v;
    } else {
      rec.failures.push_back({col.label, std::string(tok), glustat::util::parse_error_cause(err)});
    }
  }
  return rec;
}

} // namespace glustat::parser
