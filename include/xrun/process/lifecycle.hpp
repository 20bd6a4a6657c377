#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

#include <sys/types.h>

#include "xrun/core/result.hpp"
#include "xrun/process/runner.hpp"

namespace xrun::process {

struct ManagedProcess {
  pid_t                                 pid_;
  pid_t                                 process_group_;
  std::filesystem::path                 work_dir_;
  std::chrono::steady_clock::time_point start_time_;
};

// Runs every child as the leader of its own process group (its own session
// for terminal runs) so the whole tree can be signalled at once. A process
// is tracked in the active set from spawn until it has been reaped.
class ProcessLifecycleManager : public ProcessRunner {
  mutable std::mutex              mutex_;
  std::map<pid_t, ManagedProcess> active_;

  void track(ManagedProcess process);
  void untrack(pid_t pid);

public:
  ProcessLifecycleManager() = default;
  ~ProcessLifecycleManager() override;

  ProcessLifecycleManager(ProcessLifecycleManager const&)            = delete;
  ProcessLifecycleManager& operator=(ProcessLifecycleManager const&) = delete;

  auto run(RunRequest const& request) -> core::Result<RunOutcome> override;

  // Escalates termination of every tracked process group.
  void terminate_all() override;

  // One entry per run() still in flight.
  [[nodiscard]] auto active() const -> std::vector<ManagedProcess>;
};

} // namespace xrun::process
