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

// Runs snippets with the toolchains installed on this host. Languages whose
// runtime the registry cannot find fail before anything is written.
class MultiLanguageExecutor : public Backend {
  security::Scanner                                 scanner_;
  std::shared_ptr<process::ProcessRunner>           runner_;
  std::shared_ptr<runtime::LanguageRuntimeRegistry> registry_;
  BackendOptions                                    options_;
  TerminalShell                                     shell_;
  ExecutionLog                                      log_;

public:
  MultiLanguageExecutor(
      security::Scanner                                 scanner,
      std::shared_ptr<process::ProcessRunner>           runner,
      std::shared_ptr<runtime::LanguageRuntimeRegistry> registry,
      BackendOptions                                    options
  );

  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Native; }
  [[nodiscard]] auto is_available() -> bool override { return true; }

  auto execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult override;
  auto run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult override;

  void cleanup() override;

  [[nodiscard]] auto statistics() const -> ExecutionStatistics override;
};

} // namespace xrun::exec
