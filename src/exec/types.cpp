#include <string>
#include <string_view>
#include <utility>

#include "xrun/exec/types.hpp"

namespace xrun::exec {

auto to_string(ExecutionStatus status) noexcept -> std::string_view {
  switch (status) {
    case ExecutionStatus::Pending: return "pending";
    case ExecutionStatus::Running: return "running";
    case ExecutionStatus::Completed: return "completed";
    case ExecutionStatus::Failed: return "failed";
    case ExecutionStatus::Timeout: return "timeout";
    case ExecutionStatus::MemoryLimit: return "memory_limit";
  }
  return "failed";
}

auto failed_result(std::string message, std::string details) -> ExecutionResult {
  ExecutionResult result;
  result.status_        = ExecutionStatus::Failed;
  result.return_code_   = -1;
  result.stderr_        = details.empty() ? message : std::move(details);
  result.error_message_ = std::move(message);
  return result;
}

auto is_security_refusal(ExecutionResult const& result) noexcept -> bool {
  return result.status_ == ExecutionStatus::Failed && result.error_message_ &&
         result.error_message_->starts_with(SECURITY_REFUSAL_PREFIX);
}

} // namespace xrun::exec
