#include "app/LineProtocol.hpp"
#include <charconv>
#include <cmath>

namespace {

// Measurement names escape ',' and ' '; tag keys/values and field keys also escape '='.
void append_escaped(std::string& out, std::string_view sv, bool escape_equals) {
  for (char c : sv) {
    if (c == ',' || c == ' ' || (escape_equals && c == '=')) out += '\\';
    if (c == '\n') { out += "\\n"; continue; }
    out += c;
  }
}

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) out.append(buf, ptr);
  else out += '0';
}

} // anonymous namespace

namespace glustat::app {

std::string measurements_to_line_protocol(const std::vector<glustat::model::Measurement>& ms, int64_t ts_ns) {
  std::string out;
  for (const auto& m : ms) {
    std::string line;
    append_escaped(line, m.name, false);
    for (const auto& [k, v] : m.tags) {
      if (v.empty()) continue;  // empty tag values are not allowed
      line += ',';
      append_escaped(line, k, true);
      line += '=';
      append_escaped(line, v, true);
    }
    line += ' ';
    bool any = false;
    for (const auto& [k, v] : m.fields) {
      if (!std::isfinite(v)) continue;
      if (any) line += ',';
      any = true;
      append_escaped(line, k, true);
      line += '=';
      append_double(line, v);
    }
    if (!any) continue;
    if (ts_ns != 0) {
      line += ' ';
      char buf[24];
      auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), ts_ns);
      line.append(buf, ptr);
    }
    line += '\n';
    out += line;
  }
  return out;
}

} // namespace glustat::app
