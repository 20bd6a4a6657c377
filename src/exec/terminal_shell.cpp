#include <chrono>
#include <exception>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/exec/pipeline.hpp"
#include "xrun/exec/terminal_shell.hpp"
#include "xrun/process/workspace.hpp"
#include "xrun/security/environment.hpp"

namespace xrun::exec {

namespace {

constexpr std::string_view SHELL_CATEGORY = "shell";

auto shell_limits(security::SecurityPolicy const& policy, std::chrono::milliseconds timeout) -> process::ProcessLimits {
  auto limits = compile_limits(policy, timeout);
  if (policy.level_ == security::SecurityLevel::Strict) {
    limits.address_space_bytes_ =
        static_cast<std::size_t>(policy.resources_.memory_limit_mb_) * core::constant::MEGABYTE;
    limits.max_processes_ = static_cast<std::size_t>(policy.resources_.max_processes_);
  }
  return limits;
}

} // namespace

auto refused_command(std::string const& command, bool interactive, std::string const& reason)
    -> TerminalExecutionResult {
  TerminalExecutionResult result;
  result.status_             = ExecutionStatus::Failed;
  result.return_code_        = -1;
  result.stderr_             = fmt::format("Security validation failed: {}", reason);
  result.error_message_      = "Command blocked by security policy";
  result.command_            = command;
  result.interactive_mode_   = interactive;
  result.security_validated_ = false;
  return result;
}

auto to_command_result(
    std::string const&                       command,
    bool                                     interactive,
    core::Result<process::RunOutcome> const& outcome,
    std::chrono::milliseconds                timeout,
    std::size_t                              max_output_bytes
) -> TerminalExecutionResult {
  TerminalExecutionResult result;
  static_cast<ExecutionResult&>(result) = to_execution_result(outcome, timeout, 0, max_output_bytes);
  result.command_          = command;
  result.interactive_mode_ = interactive;

  if (result.status_ == ExecutionStatus::Timeout) {
    result.error_message_ = fmt::format("Command timed out after {} seconds", format_seconds(timeout));
  } else if (result.status_ == ExecutionStatus::Failed && outcome && !outcome->signaled_) {
    result.error_message_ = fmt::format("Command exited with code {}", outcome->exit_code_);
  }
  return result;
}

TerminalShell::TerminalShell(
    security::Scanner                       scanner,
    std::shared_ptr<process::ProcessRunner> runner,
    std::filesystem::path                   work_dir,
    core::env::Environment                  inherited_env
)
    : scanner_(std::move(scanner))
    , runner_(std::move(runner))
    , work_dir_(std::move(work_dir))
    , inherited_env_(std::move(inherited_env)) {}

auto TerminalShell::execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  if (code.language_ != runtime::Language::Bash) {
    auto result = failed_result(
        fmt::format("Terminal backend cannot run {} snippets", runtime::to_string(code.language_))
    );
    log_.record(std::string(runtime::to_string(code.language_)), code.content_, result, true);
    return result;
  }
  return run_command(code.content_, timeout, false);
}

auto TerminalShell::run_command(std::string const& command, Timeout timeout, bool interactive)
    -> TerminalExecutionResult {
  auto const& policy = scanner_.policy();

  TerminalExecutionResult result;
  bool                    validated = false;
  try {
    auto check = scanner_.scan_command(command);
    if (!check.is_safe_) {
      core::log::warn("command refused: {}", check.reason_);
      result = refused_command(command, interactive, check.reason_);
    } else {
      validated = true;
      auto limit = timeout.value_or(std::chrono::seconds{policy.resources_.execution_timeout_sec_});
      result     = run_validated(command, limit, interactive);
    }
  } catch (std::exception const& e) {
    static_cast<ExecutionResult&>(result) = failed_result(fmt::format("Execution error: {}", e.what()));
    result.command_                       = command;
    result.interactive_mode_              = interactive;
  }

  log_.record(std::string(SHELL_CATEGORY), command, result, validated);
  return result;
}

auto TerminalShell::run_validated(std::string const& command, std::chrono::milliseconds timeout, bool interactive)
    -> TerminalExecutionResult {
  auto const& policy = scanner_.policy();

  if (interactive && !policy.terminal_.enable_interactive_mode_) {
    TerminalExecutionResult result;
    static_cast<ExecutionResult&>(result) = failed_result("Interactive mode is disabled by the security policy");
    result.command_                       = command;
    result.interactive_mode_              = interactive;
    return result;
  }

  // Strict commands never see the caller's directory.
  std::optional<process::Workspace> scratch;
  std::filesystem::path             cwd = work_dir_;
  if (policy.level_ == security::SecurityLevel::Strict) {
    auto workspace = process::Workspace::create("xrun_term_");
    if (!workspace) {
      return to_command_result(command, interactive, std::unexpected(workspace.error()), timeout, 0);
    }
    cwd = workspace->path();
    scratch.emplace(std::move(*workspace));
  } else if (cwd.empty()) {
    std::error_code ec;
    cwd = std::filesystem::current_path(ec);
    if (ec) {
      return to_command_result(
          command, interactive, std::unexpected(fmt::format("cannot determine working directory: {}", ec.message())),
          timeout, 0
      );
    }
  }

  process::RunRequest request;
  request.argv_             = {std::string(core::constant::SHELL_PATH), "-c", command};
  request.work_dir_         = cwd;
  request.env_              = security::secure_environment(policy.level_, inherited_env_);
  request.timeout_          = timeout;
  request.limits_           = shell_limits(policy, timeout);
  request.max_output_bytes_ = output_budget(policy);
  request.stdio_            = interactive ? process::StdioMode::Terminal : process::StdioMode::Pipes;

  core::log::debug("running command in {}", cwd.string());
  return to_command_result(command, interactive, runner_->run(request), timeout, request.max_output_bytes_);
}

void TerminalShell::cleanup() {
  runner_->terminate_all();
}

auto TerminalShell::statistics() const -> ExecutionStatistics {
  return log_.statistics();
}

} // namespace xrun::exec
