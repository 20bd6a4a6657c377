#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "xrun/core/env.hpp"
#include "xrun/exec/backend.hpp"
#include "xrun/exec/execution_log.hpp"
#include "xrun/process/runner.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec {

// Runs shell command lines through /bin/sh, on a pseudo-terminal when
// interactive. Every command is validated first; a refused command never
// reaches the runner.
class TerminalShell : public Backend {
  security::Scanner                       scanner_;
  std::shared_ptr<process::ProcessRunner> runner_;
  std::filesystem::path                   work_dir_;
  core::env::Environment                  inherited_env_;
  ExecutionLog                            log_;

  auto run_validated(std::string const& command, std::chrono::milliseconds timeout, bool interactive)
      -> TerminalExecutionResult;

public:
  TerminalShell(
      security::Scanner                       scanner,
      std::shared_ptr<process::ProcessRunner> runner,
      std::filesystem::path                   work_dir,
      core::env::Environment                  inherited_env
  );

  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Terminal; }
  [[nodiscard]] auto is_available() -> bool override { return true; }

  // Only bash snippets; they run as a command line.
  auto execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult override;
  auto run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult override;

  void cleanup() override;

  [[nodiscard]] auto statistics() const -> ExecutionStatistics override;
};

// Result for a command that failed validation.
auto refused_command(std::string const& command, bool interactive, std::string const& reason)
    -> TerminalExecutionResult;

auto to_command_result(
    std::string const&                       command,
    bool                                     interactive,
    core::Result<process::RunOutcome> const& outcome,
    std::chrono::milliseconds                timeout,
    std::size_t                              max_output_bytes
) -> TerminalExecutionResult;

} // namespace xrun::exec
