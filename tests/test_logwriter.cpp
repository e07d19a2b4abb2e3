#include "minitest.hpp"
#include "app/LogWriter.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>
#include <string>
#include <unistd.h>

using glustat::model::Measurement;

static std::filesystem::path test_dir(const char* suffix) {
  return std::filesystem::temp_directory_path() /
         ("glustat_logwriter_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static void publish_one(glustat::app::SnapshotBuffers& buffers, int64_t finished_ms) {
  auto& back = buffers.back();
  back.ok = true;
  back.finished_ms = finished_ms;
  back.measurements = {Measurement{"glusterfs", {{"read", 512}}, {{"volume", "vol0"}, {"brick", "h:/b"}}}};
  buffers.publish();
}

TEST(logwriter_creates_directory) {
  auto dir = test_dir("mkdir");
  std::filesystem::remove_all(dir);
  ASSERT_TRUE(!std::filesystem::exists(dir));

  glustat::app::SnapshotBuffers buffers;
  glustat::app::LogWriter writer(buffers, dir);
  ASSERT_TRUE(std::filesystem::is_directory(dir));

  std::filesystem::remove_all(dir);
}

TEST(logwriter_writes_snapshots) {
  auto dir = test_dir("write");
  std::filesystem::remove_all(dir);

  glustat::app::SnapshotBuffers buffers;
  glustat::app::LogWriter writer(buffers, dir, std::chrono::milliseconds(50));
  writer.start();
  publish_one(buffers, 1700000000001);
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  publish_one(buffers, 1700000000002);
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  writer.stop();

  int file_count = 0;
  int ts_count = 0;
  bool saw_field = false;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().extension() != ".prom") continue;
    ++file_count;
    ASSERT_TRUE(entry.path().filename().string().starts_with("glustat_"));
    std::ifstream f(entry.path());
    std::string line;
    while (std::getline(f, line)) {
      if (line.starts_with("# glustat_scrape_timestamp_ms ")) ++ts_count;
      if (line == "glusterfs_read{brick=\"h:/b\",volume=\"vol0\"} 512") saw_field = true;
    }
  }
  // two files only if the hour rolled over mid-test
  ASSERT_TRUE(file_count >= 1);
  ASSERT_EQ(ts_count, 2);
  ASSERT_TRUE(saw_field);

  std::filesystem::remove_all(dir);
}

TEST(logwriter_empty_snapshot) {
  auto dir = test_dir("empty");
  std::filesystem::remove_all(dir);

  // Nothing published: seq() stays 0 and no file is opened
  glustat::app::SnapshotBuffers buffers;
  glustat::app::LogWriter writer(buffers, dir, std::chrono::milliseconds(50));
  writer.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  writer.stop();

  int file_count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++file_count;
  }
  ASSERT_EQ(file_count, 0);

  std::filesystem::remove_all(dir);
}
