#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "model/Measurement.hpp"

namespace glustat::app {

// InfluxDB line protocol, one line per measurement:
//   glusterfs,brick=host:/b1,volume=vol0 read=12345 1700000000000000000
// Tags and fields are written in key order. Non-finite field values are
// dropped; a measurement left without fields is skipped. ts_ns == 0 omits
// the timestamp.
[[nodiscard]] std::string measurements_to_line_protocol(const std::vector<glustat::model::Measurement>& ms,
                                                        int64_t ts_ns = 0);

} // namespace glustat::app
