#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Measurement.hpp"

namespace glustat::parser {

// Per-fop statistics line of `gluster volume profile ... info cumulative`:
//
//   %-latency  Avg-latency  Min-Latency  Max-Latency  No. of calls  Fop
//      0.46     1234.00 us     10.00 us   5000.00 us            42  WRITE
//
// The column layout is positional; this is the only place that knows it.
inline constexpr size_t kFopTokenCount = 9;

struct FopRecord {
  std::string op;                                      // lower-cased fop name
  glustat::model::FieldSet fields;                     // only fields that parsed
  std::vector<glustat::model::FieldParseFailure> failures;
};

// Returns std::nullopt when the line does not have exactly kFopTokenCount
// tokens (headers, separators). Unparseable numbers are reported per field.
[[nodiscard]] std::optional<FopRecord> extract_fop(std::string_view trimmed_line);

} // namespace glustat::parser
