#include "app/SnapshotBuffers.hpp"

#include <utility>

namespace glustat::app {

void SnapshotBuffers::publish() {
  std::lock_guard<std::mutex> lk(mu_);
  back_.seq = front_.seq + 1;
  std::swap(front_, back_);
  seq_.store(front_.seq, std::memory_order_release);
}

glustat::model::CycleSnapshot SnapshotBuffers::front() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

} // namespace glustat::app
