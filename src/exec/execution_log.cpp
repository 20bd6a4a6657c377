#include <chrono>
#include <mutex>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "xrun/exec/execution_log.hpp"

namespace xrun::exec {

namespace {

// Commands are truncated so the log stays small.
constexpr std::size_t SUBJECT_LIMIT = 100;

} // namespace

ExecutionLog::ExecutionLog(std::size_t capacity) noexcept
    : capacity_(capacity) {}

void ExecutionLog::record(
    std::string            category,
    std::string            subject,
    ExecutionResult const& result,
    bool                   security_passed
) {
  if (subject.size() > SUBJECT_LIMIT) {
    subject.resize(SUBJECT_LIMIT);
  }

  std::lock_guard lock(mutex_);
  records_.push_back(ExecutionRecord{
      .timestamp_          = std::chrono::system_clock::now(),
      .category_           = std::move(category),
      .subject_            = std::move(subject),
      .status_             = result.status_,
      .execution_time_sec_ = result.execution_time_sec_,
      .return_code_        = result.return_code_,
      .stdout_length_      = result.stdout_.size(),
      .stderr_length_      = result.stderr_.size(),
      .security_passed_    = security_passed,
  });
  while (records_.size() > capacity_) {
    records_.pop_front();
  }
}

auto ExecutionLog::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return records_.size();
}

auto ExecutionLog::statistics() const -> ExecutionStatistics {
  std::lock_guard     lock(mutex_);
  ExecutionStatistics stats;
  stats.total_executions_ = records_.size();
  if (records_.empty()) {
    return stats;
  }

  double total_time = 0.0;
  for (auto const& record : records_) {
    if (record.status_ == ExecutionStatus::Completed) {
      ++stats.successful_executions_;
    }
    if (!record.security_passed_) {
      ++stats.security_violations_;
    }
    total_time += record.execution_time_sec_;
    ++stats.language_distribution_[record.category_];
  }

  auto total                        = static_cast<double>(stats.total_executions_);
  stats.success_rate_               = static_cast<double>(stats.successful_executions_) / total;
  stats.average_execution_time_sec_ = total_time / total;
  return stats;
}

void ExecutionLog::clear() {
  std::lock_guard lock(mutex_);
  records_.clear();
}

auto statistics_to_json(ExecutionStatistics const& stats) -> nlohmann::json {
  return nlohmann::json{
      {"total_executions", stats.total_executions_},
      {"successful_executions", stats.successful_executions_},
      {"success_rate", stats.success_rate_},
      {"average_execution_time", stats.average_execution_time_sec_},
      {"language_distribution", stats.language_distribution_},
      {"security_violations", stats.security_violations_},
  };
}

} // namespace xrun::exec
