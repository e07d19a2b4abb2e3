#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "model/Measurement.hpp"

namespace glustat::model {

// Result of one collection cycle over every configured volume.
struct CycleSnapshot {
  uint64_t seq{};
  bool ok{false};
  std::string error;                  // fatal cycle error, empty when ok
  double duration_s{};
  int64_t finished_ms{};              // wall clock, ms since epoch
  std::vector<Measurement> measurements;
  std::vector<std::string> field_errors;
};

} // namespace glustat::model
