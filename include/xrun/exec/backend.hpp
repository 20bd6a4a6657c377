#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "xrun/core/constant.hpp"
#include "xrun/core/env.hpp"
#include "xrun/core/result.hpp"
#include "xrun/exec/execution_log.hpp"
#include "xrun/exec/types.hpp"

namespace xrun::exec {

enum struct BackendKind {
  Process,
  Container,
  CloudA,
  CloudB,
  Native,
  Terminal,
};

// Mode names as they appear in configuration: sandbox, docker, e2b, daytona, multi, terminal.
[[nodiscard]] auto to_string(BackendKind kind) noexcept -> std::string_view;
auto parse_backend_kind(std::string_view mode) -> core::Result<BackendKind>;

using Timeout = std::optional<std::chrono::milliseconds>;

// Host-side settings shared by every backend built for one session.
struct BackendOptions {
  std::filesystem::path     work_dir_;
  std::chrono::milliseconds compile_timeout_ = core::constant::DEFAULT_COMPILE_TIMEOUT;
  core::env::Environment    inherited_env_;
};

class Backend {
public:
  virtual ~Backend() = default;

  [[nodiscard]] virtual auto kind() const noexcept -> BackendKind = 0;

  // May check the substrate; implementations cache the answer.
  [[nodiscard]] virtual auto is_available() -> bool = 0;

  virtual auto execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult = 0;
  virtual auto run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult = 0;

  // Terminates anything still running and releases remote sessions.
  virtual void cleanup() = 0;

  [[nodiscard]] virtual auto statistics() const -> ExecutionStatistics = 0;
};

} // namespace xrun::exec
