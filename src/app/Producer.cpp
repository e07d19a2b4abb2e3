#include "app/Producer.hpp"
#include "app/MeasurementBuffer.hpp"
#include <algorithm>
#include <cstdio>

using namespace std::chrono;
using namespace std::chrono_literals;

namespace glustat::app {

bool collect_cycle(const glustat::collectors::ProfileCollector& collector, glustat::model::CycleSnapshot& out) {
  out.measurements.clear();
  out.field_errors.clear();
  out.error.clear();

  MeasurementBuffer sink;
  auto t0 = steady_clock::now();
  auto err = collector.gather(sink);
  out.duration_s = duration_cast<duration<double>>(steady_clock::now() - t0).count();
  out.finished_ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();

  out.measurements = sink.take_measurements();
  out.field_errors = sink.take_errors();
  for (const auto& e : out.field_errors) {
    std::fprintf(stderr, "glustat: warning: %s\n", e.c_str());
  }
  if (err) {
    out.ok = false;
    out.error = err->message;
    std::fprintf(stderr, "glustat: error: volume %s: %s\n", err->volume.c_str(), err->message.c_str());
  } else {
    out.ok = true;
  }
  return out.ok;
}

Producer::Producer(SnapshotBuffers& buffers, const glustat::collectors::ProfileCollector& collector,
                   milliseconds interval)
    : buffers_(buffers), collector_(collector), interval_(interval) {}

Producer::~Producer() { stop(); }

void Producer::start() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Producer::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void Producer::run_once() {
  collect_cycle(collector_, buffers_.back());
  buffers_.publish();
}

void Producer::run(std::stop_token st) {
  while (!st.stop_requested()) {
    auto next = steady_clock::now() + interval_;
    run_once();
    // sleep until the next cycle in bounded slices so stop() stays prompt
    while (!st.stop_requested()) {
      auto left = duration_cast<milliseconds>(next - steady_clock::now());
      if (left <= 0ms) break;
      std::this_thread::sleep_for(std::min(left, milliseconds(100)));
    }
  }
}

} // namespace glustat::app
