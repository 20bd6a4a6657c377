#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "xrun/core/constant.hpp"
#include "xrun/exec/types.hpp"

namespace xrun::exec {

struct ExecutionRecord {
  std::chrono::system_clock::time_point timestamp_;
  std::string                           category_;
  std::string                           subject_;
  ExecutionStatus                       status_;
  double                                execution_time_sec_;
  int                                   return_code_;
  std::size_t                           stdout_length_;
  std::size_t                           stderr_length_;
  bool                                  security_passed_;
};

struct ExecutionStatistics {
  std::size_t                        total_executions_           = 0;
  std::size_t                        successful_executions_      = 0;
  double                             success_rate_               = 0.0;
  double                             average_execution_time_sec_ = 0.0;
  std::map<std::string, std::size_t> language_distribution_;
  std::size_t                        security_violations_        = 0;
};

// Keeps the most recent records only.
class ExecutionLog {
  std::size_t                 capacity_;
  mutable std::mutex          mutex_;
  std::deque<ExecutionRecord> records_;

public:
  explicit ExecutionLog(std::size_t capacity = core::constant::HISTORY_CAPACITY) noexcept;

  // category is the language for snippets and "shell" for commands.
  void record(std::string category, std::string subject, ExecutionResult const& result, bool security_passed);

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto statistics() const -> ExecutionStatistics;
  void clear();
};

auto statistics_to_json(ExecutionStatistics const& stats) -> nlohmann::json;

} // namespace xrun::exec
