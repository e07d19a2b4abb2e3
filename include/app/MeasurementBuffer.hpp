#pragma once
#include <string>
#include <vector>
#include "collectors/IMetricsSink.hpp"
#include "model/Measurement.hpp"

namespace glustat::app {

// Sink that keeps everything it is given, in arrival order.
class MeasurementBuffer final : public glustat::collectors::IMetricsSink {
public:
  void add_fields(std::string_view measurement, const glustat::model::FieldSet& fields,
                  const glustat::model::TagSet& tags) override;
  void add_error(std::string message) override;

  [[nodiscard]] const std::vector<glustat::model::Measurement>& measurements() const { return measurements_; }
  [[nodiscard]] const std::vector<std::string>& errors() const { return errors_; }

  // Move the contents out, leaving the buffer empty.
  [[nodiscard]] std::vector<glustat::model::Measurement> take_measurements();
  [[nodiscard]] std::vector<std::string> take_errors();

private:
  std::vector<glustat::model::Measurement> measurements_;
  std::vector<std::string> errors_;
};

} // namespace glustat::app
