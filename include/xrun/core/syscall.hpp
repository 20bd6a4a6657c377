#pragma once

#include <expected>

#include <sys/resource.h>
#include <sys/types.h>

namespace xrun::core::syscall {

// Errors carry errno.
template<typename T>
using Result = std::expected<T, int>;

// RLIMIT_* constants; glibc gives them an enum type of their own.
using ResourceKind = decltype(RLIMIT_CPU);

struct WaitInfo {
  pid_t  pid_;
  int    status_;
  rusage usage_;
};

auto kill_group(pid_t pgid, int signal) -> Result<void>;

// A group exists while any member is alive, even one we may not signal.
auto group_exists(pid_t pgid) -> bool;

// Retries on EINTR. Returns pid 0 when WNOHANG is set and the child has not
// changed state; rusage covers the reaped child and its waited-for descendants.
auto wait_for_process(pid_t pid, int options = 0) -> Result<WaitInfo>;

auto fork_process() -> Result<pid_t>;

// Caps one resource of the calling process, soft and hard alike.
auto limit_resource(ResourceKind resource, rlim_t value) -> Result<void>;

} // namespace xrun::core::syscall
