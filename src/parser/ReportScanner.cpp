#include "parser/ReportScanner.hpp"
#include "parser/FopExtractor.hpp"
#include "parser/LineClassifier.hpp"
#include "util/Text.hpp"

namespace glustat::parser {

ReportScanner::ReportScanner(std::string volume, std::string_view text)
    : text_(text), ctx_(std::move(volume)) {}

bool ReportScanner::next_line(std::string_view& line) {
  if (pos_ >= text_.size()) return false;
  size_t nl = text_.find('\n', pos_);
  size_t end = (nl == std::string_view::npos) ? text_.size() : nl;
  line = text_.substr(pos_, end - pos_);
  pos_ = (nl == std::string_view::npos) ? text_.size() : nl + 1;
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return true;
}

ScanItem ReportScanner::counter_item(const char* field, std::string_view digits) const {
  ScanItem item;
  std::errc err{};
  if (auto v = glustat::util::parse_double(digits, &err)) {
    item.measurement = glustat::model::Measurement{kMeasurementName, {{field, *v}}, ctx_.tags()};
  } else {
    item.failures.push_back({field, std::string(digits), glustat::util::parse_error_cause(err)});
  }
  return item;
}

std::optional<ScanItem> ReportScanner::next() {
  std::string_view line;
  while (next_line(line)) {
    auto m = classify_line(line);
    switch (m.kind) {
      case LineKind::BrickHeader:
        ctx_.on_brick_header(m.value);
        break;
      case LineKind::ReadBytes:
        return counter_item("read", m.value);
      case LineKind::WriteBytes:
        return counter_item("write", m.value);
      case LineKind::FopCandidate: {
        auto rec = extract_fop(m.value);
        if (!rec) break;  // wrong column count: header or separator
        ScanItem item;
        item.measurement = glustat::model::Measurement{kMeasurementName, std::move(rec->fields), ctx_.tags()};
        item.failures = std::move(rec->failures);
        return item;
      }
      case LineKind::NoMatch:
        break;
    }
  }
  return std::nullopt;
}

ScanResult scan_report(std::string_view volume, std::string_view text) {
  ScanResult out;
  ReportScanner scanner{std::string(volume), text};
  while (auto item = scanner.next()) {
    if (item->measurement) out.measurements.push_back(std::move(*item->measurement));
    for (auto& f : item->failures) out.failures.push_back(std::move(f));
  }
  return out;
}

} // namespace glustat::parser
