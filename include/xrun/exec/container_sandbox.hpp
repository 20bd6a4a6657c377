#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <sys/types.h>

#include "xrun/exec/backend.hpp"
#include "xrun/exec/execution_log.hpp"
#include "xrun/exec/terminal_shell.hpp"
#include "xrun/process/runner.hpp"
#include "xrun/runtime/language.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec {

struct ContainerSettings {
  std::string                             binary_ = "docker";
  std::map<runtime::Language, std::string> images_;
};

// Isolation flags for `docker run` under the policy. The container runs as
// the given user so it can write to the host workspace it mounts.
auto container_run_flags(security::SecurityPolicy const& policy, uid_t uid, gid_t gid) -> std::vector<std::string>;

// Wraps each step in a throwaway container with the workspace mounted at
// /workspace. Containers still running are tracked by name so they can be
// killed when the client process alone would leave them behind.
class ContainerRunner {
  std::shared_ptr<process::ProcessRunner> inner_;
  std::string                             binary_;
  std::vector<std::string>                flags_;

  std::atomic<unsigned> counter_{0};
  std::mutex            mutex_;
  std::set<std::string> running_;

  void kill_container(std::string const& name);

public:
  ContainerRunner(std::shared_ptr<process::ProcessRunner> inner, std::string binary, std::vector<std::string> flags);

  auto run(std::string const& image, process::RunRequest const& request) -> core::Result<process::RunOutcome>;

  // Full docker command line for a step, without running it.
  [[nodiscard]] auto command_for(std::string const& name, std::string const& image, process::RunRequest const& request)
      const -> std::vector<std::string>;

  void kill_all();
};

class ContainerSandbox : public Backend {
  security::Scanner                       scanner_;
  std::shared_ptr<process::ProcessRunner> runner_;
  ContainerSettings                       settings_;
  BackendOptions                          options_;
  ContainerRunner                         containers_;
  TerminalShell                           shell_;
  ExecutionLog                            log_;

  std::mutex          check_mutex_;
  std::optional<bool> available_;

public:
  ContainerSandbox(
      security::Scanner                       scanner,
      std::shared_ptr<process::ProcessRunner> runner,
      ContainerSettings                       settings,
      BackendOptions                          options
  );

  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Container; }

  // `docker version` must succeed within the check timeout.
  [[nodiscard]] auto is_available() -> bool override;

  auto execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult override;
  auto run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult override;

  void cleanup() override;

  [[nodiscard]] auto statistics() const -> ExecutionStatistics override;

  [[nodiscard]] auto image_for(runtime::Language language) const -> std::string;
};

} // namespace xrun::exec
