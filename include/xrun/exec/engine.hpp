#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "xrun/core/result.hpp"
#include "xrun/exec/execution_log.hpp"
#include "xrun/exec/factory.hpp"
#include "xrun/exec/types.hpp"
#include "xrun/security/policy.hpp"

namespace xrun::exec {

// Entry point for callers: one policy, one factory, one history of what ran.
// Nothing thrown below reaches the caller; every failure is a result.
class Engine {
  FactoryOptions options_;
  BackendBuilder builder_;
  ExecutionLog   log_;

  mutable std::mutex               mutex_;
  std::shared_ptr<ExecutorFactory> factory_;

  struct Token {
    explicit Token() = default;
  };

  [[nodiscard]] auto current_factory() const -> std::shared_ptr<ExecutorFactory>;

public:
  Engine(Token, FactoryOptions options, BackendBuilder builder, std::shared_ptr<ExecutorFactory> factory);

  static auto create(security::SecurityPolicy policy, FactoryOptions options, BackendBuilder builder = {})
      -> core::Result<std::unique_ptr<Engine>>;

  ~Engine();
  Engine(Engine const&)            = delete;
  Engine& operator=(Engine const&) = delete;

  // Unknown language names fail without touching a backend.
  auto execute(std::string const& code, std::string_view language, Timeout timeout = std::nullopt)
      -> ExecutionResult;
  auto execute(CodeBlock const& code, Timeout timeout = std::nullopt) -> ExecutionResult;

  auto run_command(std::string const& command, Timeout timeout = std::nullopt, bool interactive = false)
      -> TerminalExecutionResult;

  [[nodiscard]] auto list_supported_languages() const -> std::vector<std::string>;
  [[nodiscard]] auto list_available_languages() const -> std::vector<std::string>;

  [[nodiscard]] auto statistics() const -> ExecutionStatistics;

  // Swaps the policy between executions; running backends are cleaned up first.
  auto set_policy(security::SecurityPolicy policy) -> core::Result<void>;
  [[nodiscard]] auto policy() const -> security::SecurityPolicy;

  [[nodiscard]] auto factory() const -> std::shared_ptr<ExecutorFactory> { return current_factory(); }

  void cleanup();
};

} // namespace xrun::exec
