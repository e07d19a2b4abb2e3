#pragma once
#include <map>
#include <string>
#include <vector>

namespace glustat::model {

// Tag keys are "volume" and "brick". Empty until a brick header is seen.
using TagSet = std::map<std::string, std::string>;

// Field name -> value. Every extracted value is carried as a double.
using FieldSet = std::map<std::string, double>;

struct Measurement {
  std::string name;
  FieldSet fields;
  TagSet tags;

  bool operator==(const Measurement&) const = default;
};

// A numeric token that could not be parsed. Non-fatal: the field is dropped
// from its record and the scan continues.
struct FieldParseFailure {
  std::string label;   // bare label, e.g. "avg_latency"
  std::string raw;     // offending token text
  std::string cause;   // e.g. "invalid number"

  bool operator==(const FieldParseFailure&) const = default;

  [[nodiscard]] std::string message() const {
    return "Expected a numerical value for " + label + " = " + raw + " (" + cause + ")";
  }
};

} // namespace glustat::model
