#pragma once
#include <chrono>
#include <string>

namespace glustat::collectors {

struct CommandResult {
  std::string output;   // stdout captured so far, also on failure
  std::string error;    // empty on success
  [[nodiscard]] bool ok() const { return error.empty(); }
};

// Runs `<binary> volume profile <volume> info cumulative` and captures stdout.
// Implementations must be safe to call from concurrent collection cycles.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  [[nodiscard]] virtual CommandResult run(const std::string& binary, const std::string& volume,
                                          std::chrono::milliseconds timeout, bool use_sudo) const = 0;
};

} // namespace glustat::collectors
