#include <cerrno>
#include <csignal>
#include <expected>

#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "xrun/core/syscall.hpp"

namespace xrun::core::syscall {

auto kill_group(pid_t pgid, int signal) -> Result<void> {
  if (killpg(pgid, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto group_exists(pid_t pgid) -> bool {
  return killpg(pgid, 0) == 0 || errno == EPERM;
}

auto wait_for_process(pid_t pid, int options) -> Result<WaitInfo> {
  int    status = 0;
  rusage usage{};
  pid_t  reaped = 0;
  do {
    reaped = wait4(pid, &status, options, &usage);
  } while (reaped == -1 && errno == EINTR);

  if (reaped == -1) {
    return std::unexpected(errno);
  }
  return WaitInfo{reaped, status, usage};
}

auto fork_process() -> Result<pid_t> {
  pid_t pid = fork();
  if (pid == -1) {
    return std::unexpected(errno);
  }
  return pid;
}

auto limit_resource(ResourceKind resource, rlim_t value) -> Result<void> {
  rlimit limit{value, value};
  if (setrlimit(resource, &limit) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

} // namespace xrun::core::syscall
