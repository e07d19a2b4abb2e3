#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "collectors/ICommandRunner.hpp"

namespace glustat::collectors {

// fork/exec runner with a stdout pipe and a wall-clock deadline.
// On timeout the child is SIGKILLed and reaped.
class ProcessRunner final : public ICommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::string& binary, const std::string& volume,
                                  std::chrono::milliseconds timeout, bool use_sudo) const override;

  // argv without the trailing nullptr; "sudo" is prepended when requested.
  [[nodiscard]] static std::vector<std::string> build_argv(const std::string& binary, const std::string& volume,
                                                           bool use_sudo);

  static constexpr size_t kMaxOutputBytes = 16u * 1024u * 1024u;
};

} // namespace glustat::collectors
