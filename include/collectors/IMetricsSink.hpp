#pragma once
#include <string>
#include <string_view>
#include "model/Measurement.hpp"

namespace glustat::collectors {

// Receives the output of a collection cycle.
class IMetricsSink {
public:
  virtual ~IMetricsSink() = default;

  virtual void add_fields(std::string_view measurement, const glustat::model::FieldSet& fields,
                          const glustat::model::TagSet& tags) = 0;

  // Non-fatal problems (field parse failures).
  virtual void add_error(std::string message) = 0;
};

} // namespace glustat::collectors
