#include "parser/BrickContext.hpp"

namespace glustat::parser {

BrickContext::BrickContext(std::string volume) : volume_(std::move(volume)) {}

const glustat::model::TagSet& BrickContext::on_brick_header(std::string_view brick_id) {
  tags_ = glustat::model::TagSet{{"volume", volume_}, {"brick", std::string(brick_id)}};
  return tags_;
}

} // namespace glustat::parser
