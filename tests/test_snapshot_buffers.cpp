#include "minitest.hpp"
#include "app/SnapshotBuffers.hpp"
#include <atomic>
#include <thread>

using glustat::model::Measurement;

TEST(snapshot_buffers_publish_swaps_and_increments_seq) {
  glustat::app::SnapshotBuffers bufs;
  ASSERT_EQ(bufs.seq(), 0u);
  auto& back = bufs.back();
  back.ok = true;
  back.measurements.push_back(Measurement{"glusterfs", {{"read", 1}}, {}});
  bufs.publish();
  auto front1 = bufs.front();
  ASSERT_EQ(front1.seq, 1u);
  ASSERT_EQ(bufs.seq(), 1u);
  ASSERT_EQ(front1.measurements.size(), 1u);

  auto& back2 = bufs.back();
  back2.measurements.clear();
  back2.ok = false;
  back2.error = "boom";
  bufs.publish();
  auto front2 = bufs.front();
  ASSERT_EQ(front2.seq, front1.seq + 1);
  ASSERT_TRUE(!front2.ok);
  ASSERT_EQ(front2.error, "boom");
  ASSERT_TRUE(front2.measurements.empty());
}

TEST(snapshot_buffers_reader_copy_is_stable) {
  glustat::app::SnapshotBuffers bufs;
  bufs.back().field_errors = {"e1"};
  bufs.publish();
  auto held = bufs.front();
  bufs.back().field_errors = {"e2", "e3"};
  bufs.publish();
  ASSERT_EQ(held.field_errors.size(), 1u);
  ASSERT_EQ(bufs.front().field_errors.size(), 2u);
}

TEST(snapshot_buffers_concurrent_readers) {
  glustat::app::SnapshotBuffers bufs;
  std::atomic<bool> torn{false};
  std::jthread reader([&](std::stop_token st) {
    while (!st.stop_requested()) {
      auto s = bufs.front();
      if (s.seq > 0 && s.measurements.size() != 2u) torn = true;
    }
  });
  for (int i = 0; i < 200; ++i) {
    auto& b = bufs.back();
    b.measurements.assign(2, Measurement{"glusterfs", {{"read", double(i)}}, {}});
    bufs.publish();
  }
  reader.request_stop();
  reader.join();
  ASSERT_TRUE(!torn.load());
  ASSERT_EQ(bufs.seq(), 200u);
}
