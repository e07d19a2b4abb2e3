#include "app/MeasurementBuffer.hpp"

namespace glustat::app {

void MeasurementBuffer::add_fields(std::string_view measurement, const glustat::model::FieldSet& fields,
                                   const glustat::model::TagSet& tags) {
  measurements_.push_back(glustat::model::Measurement{std::string(measurement), fields, tags});
}

void MeasurementBuffer::add_error(std::string message) { errors_.push_back(std::move(message)); }

std::vector<glustat::model::Measurement> MeasurementBuffer::take_measurements() {
  auto out = std::move(measurements_);
  measurements_.clear();
  return out;
}

std::vector<std::string> MeasurementBuffer::take_errors() {
  auto out = std::move(errors_);
  errors_.clear();
  return out;
}

} // namespace glustat::app
