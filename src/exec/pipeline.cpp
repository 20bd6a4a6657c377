#include <chrono>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/exec/pipeline.hpp"
#include "xrun/process/workspace.hpp"
#include "xrun/security/environment.hpp"

namespace xrun::exec {

namespace {

auto make_request(
    std::vector<std::string>      argv,
    std::filesystem::path const&  work_dir,
    PipelineOptions const&        options,
    std::chrono::milliseconds     timeout,
    process::ProcessLimits const& limits
) -> process::RunRequest {
  process::RunRequest request;
  request.argv_             = std::move(argv);
  request.work_dir_         = work_dir;
  request.env_              = options.env_;
  request.timeout_          = timeout;
  request.limits_           = limits;
  request.max_output_bytes_ = options.max_output_bytes_;
  return request;
}

} // namespace

auto format_seconds(std::chrono::milliseconds duration) -> std::string {
  return fmt::format("{:g}", static_cast<double>(duration.count()) / 1000.0);
}

auto output_budget(security::SecurityPolicy const& policy) noexcept -> std::size_t {
  return static_cast<std::size_t>(policy.resources_.max_output_size_mb_) * core::constant::MEGABYTE;
}

auto effective_timeout(Timeout timeout, security::SecurityPolicy const& policy, runtime::LanguageConfig const& config)
    -> std::chrono::milliseconds {
  if (timeout) {
    return *timeout;
  }
  auto scaled = static_cast<double>(policy.resources_.execution_timeout_sec_) * 1000.0 * config.timeout_multiplier_;
  return std::chrono::milliseconds{static_cast<long long>(std::llround(scaled))};
}

auto run_limits(
    security::SecurityPolicy const& policy,
    runtime::LanguageConfig const&  config,
    std::chrono::milliseconds       timeout,
    bool                            apply_memory_multiplier
) -> process::ProcessLimits {
  process::ProcessLimits limits;

  if (config.limit_address_space_) {
    double memory_mb = policy.resources_.memory_limit_mb_;
    if (apply_memory_multiplier) {
      memory_mb *= config.memory_multiplier_;
    }
    limits.address_space_bytes_ = static_cast<std::size_t>(memory_mb * static_cast<double>(core::constant::MEGABYTE));
  }

  // One spare second so the wall-clock deadline normally fires first.
  auto cpu_seconds    = std::chrono::ceil<std::chrono::seconds>(timeout).count() + 1;
  limits.cpu_seconds_ = static_cast<std::size_t>(cpu_seconds);

  limits.file_size_bytes_ =
      static_cast<std::size_t>(policy.file_system_.max_file_size_mb_) * core::constant::MEGABYTE;

  if (policy.level_ == security::SecurityLevel::Strict) {
    limits.max_processes_ = static_cast<std::size_t>(policy.resources_.max_processes_);
  }
  return limits;
}

auto compile_limits(security::SecurityPolicy const& policy, std::chrono::milliseconds timeout)
    -> process::ProcessLimits {
  process::ProcessLimits limits;
  limits.cpu_seconds_     = static_cast<std::size_t>(std::chrono::ceil<std::chrono::seconds>(timeout).count() + 1);
  limits.file_size_bytes_ =
      static_cast<std::size_t>(policy.file_system_.max_file_size_mb_) * core::constant::MEGABYTE;
  return limits;
}

auto pipeline_options(
    security::SecurityPolicy const& policy,
    runtime::LanguageConfig const&  config,
    Timeout                         timeout,
    BackendOptions const&           backend,
    bool                            apply_memory_multiplier
) -> PipelineOptions {
  PipelineOptions options;
  options.run_timeout_      = effective_timeout(timeout, policy, config);
  options.compile_timeout_  = backend.compile_timeout_;
  options.run_limits_       = run_limits(policy, config, options.run_timeout_, apply_memory_multiplier);
  options.compile_limits_   = compile_limits(policy, options.compile_timeout_);
  options.env_              = security::secure_environment(policy.level_, backend.inherited_env_);
  options.max_output_bytes_ = output_budget(policy);
  options.monitor_memory_   = policy.enable_resource_monitoring_;

  double memory_mb = policy.resources_.memory_limit_mb_;
  if (apply_memory_multiplier) {
    memory_mb *= config.memory_multiplier_;
  }
  options.memory_limit_mb_ = static_cast<int>(memory_mb);
  return options;
}

auto security_gate(security::Scanner const& scanner, CodeBlock const& code) -> std::optional<ExecutionResult> {
  if (!scanner.policy().enable_security_scanning_) {
    return std::nullopt;
  }

  auto check = scanner.scan_code(code.content_, runtime::to_string(code.language_));
  if (check.is_safe_) {
    return std::nullopt;
  }

  core::log::info("snippet rejected by security scan: {}", check.reason_);
  return failed_result(
      fmt::format("{}: {}", SECURITY_REFUSAL_PREFIX, check.reason_), fmt::format("Security scan failed: {}", check.reason_)
  );
}

auto to_execution_result(
    core::Result<process::RunOutcome> const& outcome,
    std::chrono::milliseconds                timeout,
    int                                      memory_limit_mb,
    std::size_t                              max_output_bytes
) -> ExecutionResult {
  if (!outcome) {
    return failed_result(fmt::format("Execution error: {}", outcome.error()));
  }

  ExecutionResult result;
  result.stdout_             = outcome->stdout_;
  result.stderr_             = outcome->stderr_;
  result.return_code_        = outcome->exit_code_;
  result.execution_time_sec_ = static_cast<double>(outcome->elapsed_.count()) / 1000.0;
  result.memory_used_mb_     = static_cast<double>(outcome->max_rss_kb_) / 1024.0;

  // SIGXCPU means RLIMIT_CPU fired before the wall clock did.
  if (outcome->timed_out_ || (outcome->signaled_ && outcome->signal_ == SIGXCPU)) {
    result.status_        = ExecutionStatus::Timeout;
    result.return_code_   = -1;
    result.error_message_ = fmt::format("Execution timed out after {} seconds", format_seconds(timeout));
  } else if (outcome->output_truncated_) {
    result.status_        = ExecutionStatus::MemoryLimit;
    result.error_message_ = fmt::format(
        "Output exceeded the {} MB limit", max_output_bytes / core::constant::MEGABYTE
    );
  } else if (memory_limit_mb > 0 && result.memory_used_mb_ > memory_limit_mb) {
    result.status_        = ExecutionStatus::MemoryLimit;
    result.error_message_ =
        fmt::format("Memory usage {:.1f} MB exceeded the {} MB limit", result.memory_used_mb_, memory_limit_mb);
  } else if (outcome->succeeded()) {
    result.status_ = ExecutionStatus::Completed;
  } else {
    result.status_        = ExecutionStatus::Failed;
    result.error_message_ = outcome->signaled_
                              ? fmt::format("Process terminated by signal {}", outcome->signal_)
                              : fmt::format("Process exited with code {}", outcome->exit_code_);
  }
  return result;
}

auto run_steps(
    process::ProcessRunner&         runner,
    runtime::LanguageConfig const&  config,
    runtime::SourceLayout const&    layout,
    std::filesystem::path const&    work_dir,
    std::string const&              dir,
    PipelineOptions const&          options
) -> ExecutionResult {
  double compile_seconds = 0.0;

  if (config.requires_compilation_) {
    auto request = make_request(
        runtime::render(config.compile_template_, layout, dir), work_dir, options, options.compile_timeout_,
        options.compile_limits_
    );
    auto compiled = runner.run(request);
    if (!compiled) {
      return failed_result(fmt::format("Compilation error: {}", compiled.error()));
    }
    compile_seconds = static_cast<double>(compiled->elapsed_.count()) / 1000.0;

    if (compiled->timed_out_) {
      ExecutionResult result;
      result.status_             = ExecutionStatus::Timeout;
      result.stdout_             = compiled->stdout_;
      result.stderr_             = compiled->stderr_;
      result.return_code_        = -1;
      result.execution_time_sec_ = compile_seconds;
      result.error_message_ =
          fmt::format("Compilation timed out after {} seconds", format_seconds(options.compile_timeout_));
      return result;
    }

    if (!compiled->succeeded()) {
      ExecutionResult result;
      result.status_             = ExecutionStatus::Failed;
      result.stdout_             = compiled->stdout_;
      result.stderr_             = compiled->stderr_;
      result.return_code_        = compiled->exit_code_ != 0 ? compiled->exit_code_ : 1;
      result.execution_time_sec_ = compile_seconds;
      result.error_message_      = fmt::format("Compilation failed with exit code {}", result.return_code_);
      return result;
    }
    core::log::debug("{} snippet compiled in {:.3f}s", config.name_, compile_seconds);
  }

  auto request = make_request(
      runtime::render(config.run_template_, layout, dir), work_dir, options, options.run_timeout_, options.run_limits_
  );
  auto result = to_execution_result(
      runner.run(request), options.run_timeout_, options.monitor_memory_ ? options.memory_limit_mb_ : 0,
      options.max_output_bytes_
  );
  result.execution_time_sec_ += compile_seconds;
  return result;
}

auto run_pipeline(
    process::ProcessRunner&         runner,
    runtime::LanguageConfig const&  config,
    std::string_view                content,
    PipelineOptions const&          options
) -> ExecutionResult {
  auto workspace = process::Workspace::create(
      fmt::format("{}{}_", options.workspace_prefix_, runtime::to_string(config.language_))
  );
  if (!workspace) {
    return failed_result(fmt::format("Execution error: {}", workspace.error()));
  }

  auto layout = runtime::layout_for(config, content);
  if (auto written = workspace->write_file(layout.source_name_, content); !written) {
    return failed_result(fmt::format("Execution error: {}", written.error()));
  }

  std::string dir = options.command_dir_.empty() ? workspace->path().string() : options.command_dir_;
  return run_steps(runner, config, layout, workspace->path(), dir, options);
}

} // namespace xrun::exec
