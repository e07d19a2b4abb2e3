#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "collectors/ICommandRunner.hpp"
#include "collectors/IMetricsSink.hpp"

namespace glustat::collectors {

struct CollectorConfig {
  std::vector<std::string> volumes{"vol0"};
  std::string binary{"/usr/sbin/gluster"};
  std::chrono::milliseconds timeout{1000};
  bool use_sudo{false};
};

struct CollectError {
  std::string volume;    // volume whose invocation failed
  std::string message;
};

// Runs the profile command for every configured volume, in order, and feeds
// the parsed records to a sink. Fail-fast: the first invocation error ends the
// cycle and later volumes are not attempted. Field parse failures are passed
// to the sink and never end the cycle.
class ProfileCollector {
public:
  ProfileCollector(CollectorConfig cfg, const ICommandRunner& runner);

  [[nodiscard]] std::optional<CollectError> gather(IMetricsSink& sink) const;

private:
  CollectorConfig cfg_;
  const ICommandRunner& runner_;
};

} // namespace glustat::collectors
