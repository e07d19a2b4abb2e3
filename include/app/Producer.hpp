#pragma once
#include <chrono>
#include <thread>
#include <stop_token>
#include "app/SnapshotBuffers.hpp"
#include "collectors/ProfileCollector.hpp"

namespace glustat::app {

// Run one collection cycle into `out` (cleared first). Returns out.ok.
bool collect_cycle(const glustat::collectors::ProfileCollector& collector, glustat::model::CycleSnapshot& out);

// Background loop: one cycle immediately, then one every `interval`,
// each published through SnapshotBuffers.
class Producer {
public:
  Producer(SnapshotBuffers& buffers, const glustat::collectors::ProfileCollector& collector,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10000));
  void start();
  void stop();
  ~Producer();

  Producer(const Producer&) = delete;
  Producer& operator=(const Producer&) = delete;

  // Collect and publish synchronously on the calling thread.
  void run_once();

private:
  void run(std::stop_token st);
  SnapshotBuffers& buffers_;
  const glustat::collectors::ProfileCollector& collector_;
  std::chrono::milliseconds interval_;
  std::jthread thread_{};
};

} // namespace glustat::app
