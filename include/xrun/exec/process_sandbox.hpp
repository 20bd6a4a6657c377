#pragma once

#include <memory>
#include <string>

#include "xrun/exec/backend.hpp"
#include "xrun/exec/execution_log.hpp"
#include "xrun/exec/terminal_shell.hpp"
#include "xrun/process/runner.hpp"
#include "xrun/runtime/registry.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec {

// Local child process per step, confined by rlimits and a scrubbed
// environment. The end of every fallback chain: always available, though a
// snippet whose runtime is missing on this host fails before it is written.
class ProcessSandbox : public Backend {
  security::Scanner                                 scanner_;
  std::shared_ptr<process::ProcessRunner>           runner_;
  std::shared_ptr<runtime::LanguageRuntimeRegistry> registry_;
  BackendOptions                                    options_;
  TerminalShell                                     shell_;
  ExecutionLog                                      log_;

public:
  ProcessSandbox(
      security::Scanner                                 scanner,
      std::shared_ptr<process::ProcessRunner>           runner,
      std::shared_ptr<runtime::LanguageRuntimeRegistry> registry,
      BackendOptions                                    options
  );

  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Process; }
  [[nodiscard]] auto is_available() -> bool override { return true; }

  auto execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult override;
  auto run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult override;

  void cleanup() override;

  [[nodiscard]] auto statistics() const -> ExecutionStatistics override;
};

} // namespace xrun::exec
