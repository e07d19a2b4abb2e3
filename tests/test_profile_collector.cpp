#include "minitest.hpp"
#include "ProfileFixtures.hpp"
#include "app/MeasurementBuffer.hpp"
#include "collectors/ProfileCollector.hpp"
#include <map>
#include <string>
#include <vector>

using namespace glustat::collectors;

namespace {

// Canned outputs per volume; a volume listed in `failing` returns an error.
class FakeRunner final : public ICommandRunner {
public:
  std::map<std::string, std::string> outputs;
  std::vector<std::string> failing;
  mutable std::vector<std::string> calls;
  mutable std::string last_binary;
  mutable std::chrono::milliseconds last_timeout{0};
  mutable bool last_sudo{false};

  CommandResult run(const std::string& binary, const std::string& volume,
                    std::chrono::milliseconds timeout, bool use_sudo) const override {
    calls.push_back(volume);
    last_binary = binary;
    last_timeout = timeout;
    last_sudo = use_sudo;
    CommandResult r;
    for (const auto& f : failing) {
      if (f == volume) {
        r.output = "partial";
        r.error = "error running gluster command: exit status 1";
        return r;
      }
    }
    auto it = outputs.find(volume);
    if (it != outputs.end()) r.output = it->second;
    return r;
  }

};

CollectorConfig config_for(std::vector<std::string> volumes) {
  CollectorConfig cfg;
  cfg.volumes = std::move(volumes);
  return cfg;
}

} // namespace

TEST(collector_defaults) {
  CollectorConfig cfg;
  ASSERT_EQ(cfg.volumes.size(), 1u);
  ASSERT_EQ(cfg.volumes[0], "vol0");
  ASSERT_EQ(cfg.binary, "/usr/sbin/gluster");
  ASSERT_EQ(cfg.timeout.count(), 1000);
  ASSERT_TRUE(!cfg.use_sudo);
}

TEST(collector_forwards_records_in_order) {
  FakeRunner runner;
  runner.outputs["vol0"] = kTwoBrickReport;
  runner.outputs["vol1"] = "Brick: h:/b\nData Read: 7 bytes\n";
  ProfileCollector collector{config_for({"vol0", "vol1"}), runner};
  glustat::app::MeasurementBuffer sink;

  auto err = collector.gather(sink);
  ASSERT_TRUE(!err.has_value());
  ASSERT_EQ(sink.measurements().size(), 8u);
  ASSERT_TRUE(sink.errors().empty());
  ASSERT_EQ(sink.measurements()[0].tags.at("volume"), "vol0");
  ASSERT_EQ(sink.measurements()[7].tags.at("volume"), "vol1");
  ASSERT_EQ(sink.measurements()[7].fields.at("read"), 7.0);
  ASSERT_EQ(runner.calls.size(), 2u);
}

TEST(collector_fail_fast_on_first_volume) {
  FakeRunner runner;
  runner.failing = {"vol0"};
  runner.outputs["vol1"] = kTwoBrickReport;
  runner.outputs["vol2"] = kTwoBrickReport;
  ProfileCollector collector{config_for({"vol0", "vol1", "vol2"}), runner};
  glustat::app::MeasurementBuffer sink;

  auto err = collector.gather(sink);
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->volume, "vol0");
  ASSERT_TRUE(err->message.starts_with("error gathering metrics: "));
  ASSERT_TRUE(err->message.find("exit status 1") != std::string::npos);
  ASSERT_EQ(runner.calls.size(), 1u);
  ASSERT_EQ(runner.calls[0], "vol0");
  ASSERT_TRUE(sink.measurements().empty());
  ASSERT_TRUE(sink.errors().empty());
}

TEST(collector_fail_fast_keeps_earlier_records) {
  FakeRunner runner;
  runner.outputs["vol0"] = "Data Written: 3 bytes\n";
  runner.failing = {"vol1"};
  ProfileCollector collector{config_for({"vol0", "vol1", "vol2"}), runner};
  glustat::app::MeasurementBuffer sink;

  auto err = collector.gather(sink);
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->volume, "vol1");
  ASSERT_EQ(runner.calls.size(), 2u);
  ASSERT_EQ(sink.measurements().size(), 1u);
  ASSERT_TRUE(sink.measurements()[0].tags.empty());
}

TEST(collector_forwards_field_errors) {
  FakeRunner runner;
  runner.outputs["vol0"] =
    "Brick: h:/b\n"
    "0.00 1.00 us 2.00 us x3 us 5 FSYNC\n";
  ProfileCollector collector{CollectorConfig{}, runner};
  glustat::app::MeasurementBuffer sink;

  auto err = collector.gather(sink);
  ASSERT_TRUE(!err.has_value());
  ASSERT_EQ(sink.measurements().size(), 1u);
  ASSERT_EQ(sink.measurements()[0].fields.count("fsync_max_latency"), 0u);
  ASSERT_EQ(sink.measurements()[0].fields.at("fsync_ncalls"), 5.0);
  ASSERT_EQ(sink.errors().size(), 1u);
  ASSERT_TRUE(sink.errors()[0].starts_with("Expected a numerical value for max_latency = x3"));
}

TEST(collector_passes_invocation_settings) {
  FakeRunner runner;
  CollectorConfig cfg;
  cfg.binary = "/opt/gluster/bin/gluster";
  cfg.timeout = std::chrono::milliseconds(250);
  cfg.use_sudo = true;
  ProfileCollector collector{cfg, runner};
  glustat::app::MeasurementBuffer sink;

  ASSERT_TRUE(!collector.gather(sink).has_value());
  ASSERT_EQ(runner.last_binary, "/opt/gluster/bin/gluster");
  ASSERT_EQ(runner.last_timeout.count(), 250);
  ASSERT_TRUE(runner.last_sudo);
  ASSERT_TRUE(sink.measurements().empty());
}

TEST(collector_cycles_are_independent) {
  FakeRunner runner;
  runner.outputs["vol0"] = kTwoBrickReport;
  ProfileCollector collector{CollectorConfig{}, runner};
  glustat::app::MeasurementBuffer a, b;
  ASSERT_TRUE(!collector.gather(a).has_value());
  ASSERT_TRUE(!collector.gather(b).has_value());
  ASSERT_TRUE(a.measurements() == b.measurements());
}
