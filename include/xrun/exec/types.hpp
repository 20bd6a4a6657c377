#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "xrun/runtime/language.hpp"

namespace xrun::exec {

enum struct ExecutionStatus {
  Pending,
  Running,
  Completed,
  Failed,
  Timeout,
  MemoryLimit,
};

[[nodiscard]] auto to_string(ExecutionStatus status) noexcept -> std::string_view;

struct CodeBlock {
  std::string                        content_;
  runtime::Language                  language_;
  std::map<std::string, std::string> metadata_;
};

struct ExecutionResult {
  ExecutionStatus            status_ = ExecutionStatus::Pending;
  std::string                stdout_;
  std::string                stderr_;
  int                        return_code_        = 0;
  double                     execution_time_sec_ = 0.0;
  double                     memory_used_mb_     = 0.0;
  std::optional<std::string> error_message_;

  [[nodiscard]] auto succeeded() const noexcept -> bool { return status_ == ExecutionStatus::Completed; }
};

struct TerminalExecutionResult : ExecutionResult {
  std::string command_;
  bool        interactive_mode_   = false;
  bool        security_validated_ = true;
};

[[nodiscard]] auto failed_result(std::string message, std::string details = {}) -> ExecutionResult;

// True for results produced by the security gate rather than by running anything.
[[nodiscard]] auto is_security_refusal(ExecutionResult const& result) noexcept -> bool;

constexpr std::string_view SECURITY_REFUSAL_PREFIX = "Security check failed";

} // namespace xrun::exec
