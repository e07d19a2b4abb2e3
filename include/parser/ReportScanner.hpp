#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Measurement.hpp"
#include "parser/BrickContext.hpp"

namespace glustat::parser {

inline constexpr const char* kMeasurementName = "glusterfs";

// One step of the scan. A line may yield a record, failures, or both
// (a fop line with some unparseable columns).
struct ScanItem {
  std::optional<glustat::model::Measurement> measurement;
  std::vector<glustat::model::FieldParseFailure> failures;
};

// Single pass, pull-based walk over one volume's cumulative profile report.
// The text must outlive the scanner. Not restartable: scan again with a
// fresh scanner over fresh output.
class ReportScanner {
public:
  ReportScanner(std::string volume, std::string_view text);

  // Next item, or std::nullopt once the input is exhausted.
  [[nodiscard]] std::optional<ScanItem> next();

  [[nodiscard]] const glustat::model::TagSet& tags() const { return ctx_.tags(); }

private:
  bool next_line(std::string_view& line);
  ScanItem counter_item(const char* field, std::string_view digits) const;

  std::string_view text_;
  size_t pos_{0};
  BrickContext ctx_;
};

struct ScanResult {
  std::vector<glustat::model::Measurement> measurements;
  std::vector<glustat::model::FieldParseFailure> failures;
};

// Drain a ReportScanner into vectors.
[[nodiscard]] ScanResult scan_report(std::string_view volume, std::string_view text);

} // namespace glustat::parser
