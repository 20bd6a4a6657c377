#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <sys/wait.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/core/syscall.hpp"
#include "xrun/process/signals.hpp"

namespace xrun::process {

PosixSignalOps::PosixSignalOps(pid_t leader) noexcept
    : leader_(leader) {}

auto PosixSignalOps::send_group(pid_t pgid, int signal) -> bool {
  if (auto result = core::syscall::kill_group(pgid, signal); !result) {
    if (result.error() != ESRCH) {
      core::log::warn("killpg({}, {}) failed: {}", pgid, signal, std::strerror(result.error()));
    }
    return false;
  }
  return true;
}

auto PosixSignalOps::group_alive(pid_t pgid) -> bool {
  if (leader_ > 0 && !reaped_) {
    if (auto waited = core::syscall::wait_for_process(leader_, WNOHANG); waited && waited->pid_ == leader_) {
      reaped_ = *waited;
    }
  }
  return core::syscall::group_exists(pgid);
}

void PosixSignalOps::sleep_for(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

auto PosixSignalOps::now() -> std::chrono::steady_clock::time_point {
  return std::chrono::steady_clock::now();
}

auto terminate_group(pid_t pgid, std::chrono::milliseconds grace, SignalOps& ops) -> Escalation {
  if (pgid <= 0 || !ops.group_alive(pgid)) {
    return Escalation::AlreadyGone;
  }

  core::log::debug("sending SIGTERM to process group {}", pgid);
  ops.send_group(pgid, SIGTERM);

  auto deadline = ops.now() + grace;
  while (ops.now() < deadline) {
    if (!ops.group_alive(pgid)) {
      return Escalation::Terminated;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - ops.now());
    ops.sleep_for(std::clamp(remaining, std::chrono::milliseconds{1}, core::constant::POLL_INTERVAL));
  }

  if (!ops.group_alive(pgid)) {
    return Escalation::Terminated;
  }

  core::log::debug("process group {} survived SIGTERM, sending SIGKILL", pgid);
  ops.send_group(pgid, SIGKILL);
  return Escalation::Killed;
}

} // namespace xrun::process
