#include "collectors/ProcessRunner.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

using namespace std::chrono;

namespace glustat::collectors {

namespace {

std::string join_args(const std::vector<std::string>& argv, size_t from) {
  std::string out = "[";
  for (size_t i = from; i < argv.size(); ++i) {
    if (i > from) out += ' ';
    out += argv[i];
  }
  out += ']';
  return out;
}

std::string describe_status(int status) {
  if (WIFEXITED(status)) {
    int code = WEXITSTATUS(status);
    if (code == 127) return "exit status 127 (command not found or not executable)";
    return "exit status " + std::to_string(code);
  }
  if (WIFSIGNALED(status)) return std::string("signal: ") + ::strsignal(WTERMSIG(status));
  return "unknown wait status " + std::to_string(status);
}

int remaining_ms(steady_clock::time_point deadline) {
  auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
  if (left < 0) return 0;
  return static_cast<int>(std::min<long long>(left, 60'000));
}

void kill_and_reap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // anonymous namespace

std::vector<std::string> ProcessRunner::build_argv(const std::string& binary, const std::string& volume,
                                                   bool use_sudo) {
  std::vector<std::string> argv;
  if (use_sudo) argv.emplace_back("sudo");
  argv.push_back(binary);
  for (const char* a : {"volume", "profile"}) argv.emplace_back(a);
  argv.push_back(volume);
  for (const char* a : {"info", "cumulative"}) argv.emplace_back(a);
  return argv;
}

CommandResult ProcessRunner::run(const std::string& binary, const std::string& volume,
                                 milliseconds timeout, bool use_sudo) const {
  CommandResult res;
  const auto argv = build_argv(binary, volume, use_sudo);
  // Mirrors the argument list as the command sees it (sudo prefix dropped).
  auto fail = [&](const std::string& cause) {
    res.error = "error running gluster command: " + cause + " - use_sudo: " + (use_sudo ? "true" : "false") +
                " - cmdArgs: " + join_args(argv, 1);
    return res;
  };

  int pipefd[2];
  if (::pipe2(pipefd, O_CLOEXEC) < 0) return fail(std::string("pipe: ") + std::strerror(errno));

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    return fail(std::string("fork: ") + std::strerror(err));
  }

  if (pid == 0) {
    ::dup2(pipefd[1], STDOUT_FILENO);
    int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    ::_exit(127);
  }

  ::close(pipefd[1]);
  const auto deadline = steady_clock::now() + timeout;
  bool timed_out = false;
  char buf[4096];

  for (;;) {
    struct pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, remaining_ms(deadline));
    if (rv < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      ::close(pipefd[0]);
      kill_and_reap(pid);
      return fail(std::string("poll: ") + std::strerror(err));
    }
    if (rv == 0) {
      if (steady_clock::now() >= deadline) { timed_out = true; break; }
      continue;
    }
    ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      break;
    }
    if (n == 0) break;  // EOF
    size_t room = kMaxOutputBytes - std::min(kMaxOutputBytes, res.output.size());
    res.output.append(buf, std::min(room, static_cast<size_t>(n)));
  }
  ::close(pipefd[0]);

  if (timed_out) {
    kill_and_reap(pid);
    return fail("command timed out after " + std::to_string(timeout.count()) + "ms");
  }

  // stdout is closed; the child may still be exiting
  int status = 0;
  for (;;) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r < 0) {
      if (errno == EINTR) continue;
      return fail(std::string("waitpid: ") + std::strerror(errno));
    }
    if (steady_clock::now() >= deadline) {
      kill_and_reap(pid);
      return fail("command timed out after " + std::to_string(timeout.count()) + "ms");
    }
    std::this_thread::sleep_for(milliseconds(2));
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) return fail(describe_status(status));
  return res;
}

} // namespace glustat::collectors
