#pragma once
#include <string>
#include <string_view>
#include "model/Measurement.hpp"

namespace glustat::parser {

// Tag context for one volume's report. Empty until the first "Brick:" header;
// each header replaces the previous context wholesale.
class BrickContext {
public:
  explicit BrickContext(std::string volume);

  const glustat::model::TagSet& on_brick_header(std::string_view brick_id);

  [[nodiscard]] const glustat::model::TagSet& tags() const { return tags_; }

private:
  std::string volume_;
  glustat::model::TagSet tags_;
};

} // namespace glustat::parser
