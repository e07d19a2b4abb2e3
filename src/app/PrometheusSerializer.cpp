#include "app/MetricsServer.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <set>
#include <unordered_map>
#include <vector>

namespace {

void append_double(std::string& out, double v) {
  if (std::isnan(v)) { out += "NaN"; return; }
  if (std::isinf(v)) { out += (v > 0 ? "+Inf" : "-Inf"); return; }
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, std::string_view name, std::string_view help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// name{k1="v1",k2="v2",...} value; tags arrive sorted by key
void emit_tagged(std::string& out, std::string_view name, const glustat::model::TagSet& tags, double value) {
  out += name;
  if (!tags.empty()) {
    out += '{';
    bool first = true;
    for (const auto& [k, v] : tags) {
      if (!first) out += ',';
      first = false;
      out += glustat::app::sanitize_metric_name(k);
      out += "=\"";
      append_escaped(out, v);
      out += '"';
    }
    out += '}';
  }
  out += ' ';
  append_double(out, value);
  out += '\n';
}

struct Sample {
  const glustat::model::TagSet* tags;
  double value;
};

struct Family {
  std::string name;
  std::string field;
  std::vector<Sample> samples;
  std::set<glustat::model::TagSet> label_sets;  // one sample per label set
};

} // anonymous namespace

namespace glustat::app {

std::string sanitize_metric_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    char c = name[i];
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':' ||
              (i > 0 && c >= '0' && c <= '9');
    out += ok ? c : '_';
  }
  if (out.empty()) out = "_";
  return out;
}

std::string snapshot_to_prometheus(const glustat::model::CycleSnapshot& s) {
  // Profile fields, grouped per family in order of first appearance. Records
  // with equal tags (e.g. untagged counters from several volumes) would
  // repeat a series; the first one wins and the rest are counted.
  std::vector<Family> families;
  std::unordered_map<std::string, size_t> index;
  uint64_t duplicates = 0;
  for (const auto& m : s.measurements) {
    for (const auto& [field, value] : m.fields) {
      std::string name = sanitize_metric_name(m.name + "_" + field);
      auto [it, inserted] = index.try_emplace(name, families.size());
      if (inserted) families.push_back(Family{name, field, {}, {}});
      auto& fam = families[it->second];
      if (!fam.label_sets.insert(m.tags).second) {
        ++duplicates;
        continue;
      }
      fam.samples.push_back(Sample{&m.tags, value});
    }
  }

  std::string out;
  out.reserve(4096);

  // ---- Cycle status ----
  emit_header(out, "glustat_cycle_success", "Whether the last collection cycle completed (1) or failed (0)", "gauge");
  emit_gauge_u(out, "glustat_cycle_success", s.ok ? 1 : 0);
  emit_header(out, "glustat_cycle_duration_seconds", "Wall time of the last collection cycle", "gauge");
  emit_gauge_d(out, "glustat_cycle_duration_seconds", s.duration_s);
  emit_header(out, "glustat_cycles_total", "Number of published collection cycles", "counter");
  emit_gauge_u(out, "glustat_cycles_total", s.seq);
  emit_header(out, "glustat_measurements", "Records produced by the last cycle", "gauge");
  emit_gauge_u(out, "glustat_measurements", s.measurements.size());
  emit_header(out, "glustat_field_errors", "Unparseable profile fields in the last cycle", "gauge");
  emit_gauge_u(out, "glustat_field_errors", s.field_errors.size());
  emit_header(out, "glustat_duplicate_series", "Profile samples dropped because their series was already written",
              "gauge");
  emit_gauge_u(out, "glustat_duplicate_series", duplicates);

  for (const auto& fam : families) {
    emit_header(out, fam.name, "GlusterFS cumulative profile field " + fam.field, "gauge");
    for (const auto& smp : fam.samples) emit_tagged(out, fam.name, *smp.tags, smp.value);
  }

  return out;
}

} // namespace glustat::app
