#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include "model/Snapshot.hpp"

namespace glustat::app {

// Double buffer for CycleSnapshot. The producer fills back() and publishes;
// readers take a consistent copy of the front.
class SnapshotBuffers {
public:
  SnapshotBuffers() = default;
  // Non-copyable
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  // Producer side only.
  glustat::model::CycleSnapshot& back() { return back_; }
  void publish(); // swap front/back, bump seq

  [[nodiscard]] glustat::model::CycleSnapshot front() const;
  [[nodiscard]] uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  glustat::model::CycleSnapshot front_{};
  glustat::model::CycleSnapshot back_{};
  std::atomic<uint64_t> seq_{0};
};

} // namespace glustat::app
