#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "xrun/core/env.hpp"
#include "xrun/exec/backend.hpp"
#include "xrun/exec/types.hpp"
#include "xrun/process/runner.hpp"
#include "xrun/runtime/language.hpp"
#include "xrun/security/policy.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec {

struct PipelineOptions {
  std::chrono::milliseconds             run_timeout_{0};
  std::chrono::milliseconds             compile_timeout_ = core::constant::DEFAULT_COMPILE_TIMEOUT;
  process::ProcessLimits                run_limits_;
  process::ProcessLimits                compile_limits_;
  std::optional<core::env::Environment> env_;
  std::size_t                           max_output_bytes_ = 10 * core::constant::MEGABYTE;
  // Directory the commands see; empty means the host workspace itself.
  std::string                           command_dir_;
  std::string                           workspace_prefix_ = "xrun_";
  int                                   memory_limit_mb_  = 0;
  bool                                  monitor_memory_   = true;
};

// Options for running a snippet on this host under the policy.
auto pipeline_options(
    security::SecurityPolicy const& policy,
    runtime::LanguageConfig const&  config,
    Timeout                         timeout,
    BackendOptions const&           backend,
    bool                            apply_memory_multiplier
) -> PipelineOptions;

// Materialises the snippet in a private workspace, compiles it when the
// language needs it and runs it. The workspace is gone when this returns.
auto run_pipeline(
    process::ProcessRunner&         runner,
    runtime::LanguageConfig const&  config,
    std::string_view                content,
    PipelineOptions const&          options
) -> ExecutionResult;

// Compile and run steps for a source already in place under dir.
// A failed compile short-circuits: the run step never starts.
auto run_steps(
    process::ProcessRunner&         runner,
    runtime::LanguageConfig const&  config,
    runtime::SourceLayout const&    layout,
    std::filesystem::path const&    work_dir,
    std::string const&              dir,
    PipelineOptions const&          options
) -> ExecutionResult;

// Maps a finished step onto the uniform result. Memory is only checked when a limit is given.
auto to_execution_result(
    core::Result<process::RunOutcome> const& outcome,
    std::chrono::milliseconds                timeout,
    int                                      memory_limit_mb,
    std::size_t                              max_output_bytes
) -> ExecutionResult;

// Returns the refusal to hand back when the snippet fails the scan.
auto security_gate(security::Scanner const& scanner, CodeBlock const& code) -> std::optional<ExecutionResult>;

// Caller's timeout, or the policy timeout scaled by the language multiplier.
auto effective_timeout(Timeout timeout, security::SecurityPolicy const& policy, runtime::LanguageConfig const& config)
    -> std::chrono::milliseconds;

// Limits for the run step of a snippet under the policy.
auto run_limits(
    security::SecurityPolicy const& policy,
    runtime::LanguageConfig const&  config,
    std::chrono::milliseconds       timeout,
    bool                            apply_memory_multiplier
) -> process::ProcessLimits;

// Compilers get CPU and file size limits only.
auto compile_limits(security::SecurityPolicy const& policy, std::chrono::milliseconds timeout) -> process::ProcessLimits;

[[nodiscard]] auto output_budget(security::SecurityPolicy const& policy) noexcept -> std::size_t;
[[nodiscard]] auto format_seconds(std::chrono::milliseconds duration) -> std::string;

} // namespace xrun::exec
