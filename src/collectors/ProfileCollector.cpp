#include "collectors/ProfileCollector.hpp"
#include "parser/ReportScanner.hpp"

namespace glustat::collectors {

ProfileCollector::ProfileCollector(CollectorConfig cfg, const ICommandRunner& runner)
    : cfg_(std::move(cfg)), runner_(runner) {}

std::optional<CollectError> ProfileCollector::gather(IMetricsSink& sink) const {
  for (const auto& volume : cfg_.volumes) {
    CommandResult res = runner_.run(cfg_.binary, volume, cfg_.timeout, cfg_.use_sudo);
    if (!res.ok()) {
      return CollectError{volume, "error gathering metrics: " + res.error};
    }

    glustat::parser::ReportScanner scanner{volume, res.output};
    while (auto item = scanner.next()) {
      if (item->measurement) {
        const auto& m = *item->measurement;
        sink.add_fields(m.name, m.fields, m.tags);
      }
      for (const auto& f : item->failures) sink.add_error(f.message());
    }
  }
  return std::nullopt;
}

} // namespace glustat::collectors
