#pragma once

#include <chrono>
#include <optional>

#include <sys/types.h>

#include "xrun/core/syscall.hpp"

namespace xrun::process {

class SignalOps {
public:
  virtual ~SignalOps() = default;

  virtual auto send_group(pid_t pgid, int signal) -> bool = 0;
  virtual auto group_alive(pid_t pgid) -> bool            = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
  virtual auto now() -> std::chrono::steady_clock::time_point = 0;
};

// Talks to the kernel. When a leader pid is given the leader is reaped while
// checking liveness so that a zombie leader does not keep the group looking alive.
class PosixSignalOps : public SignalOps {
  pid_t                                  leader_ = -1;
  std::optional<core::syscall::WaitInfo> reaped_;

public:
  PosixSignalOps() = default;
  explicit PosixSignalOps(pid_t leader) noexcept;

  auto send_group(pid_t pgid, int signal) -> bool override;
  auto group_alive(pid_t pgid) -> bool override;
  void sleep_for(std::chrono::milliseconds duration) override;
  auto now() -> std::chrono::steady_clock::time_point override;

  [[nodiscard]] auto reaped() const noexcept -> std::optional<core::syscall::WaitInfo> const& { return reaped_; }
};

enum struct Escalation {
  AlreadyGone,
  Terminated,
  Killed,
};

// SIGTERM to the group, wait up to grace for it to disappear, then SIGKILL.
auto terminate_group(pid_t pgid, std::chrono::milliseconds grace, SignalOps& ops) -> Escalation;

} // namespace xrun::process
