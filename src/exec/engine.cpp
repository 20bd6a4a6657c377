#include <exception>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "xrun/core/log.hpp"
#include "xrun/exec/engine.hpp"
#include "xrun/process/lifecycle.hpp"

namespace xrun::exec {

Engine::Engine(Token, FactoryOptions options, BackendBuilder builder, std::shared_ptr<ExecutorFactory> factory)
    : options_(std::move(options)), builder_(std::move(builder)), factory_(std::move(factory)) {}

Engine::~Engine() {
  cleanup();
}

auto Engine::create(security::SecurityPolicy policy, FactoryOptions options, BackendBuilder builder)
    -> core::Result<std::unique_ptr<Engine>> {
  // One registry for the session so availability is checked once.
  if (!options.registry_) {
    options.registry_ =
        std::make_shared<runtime::LanguageRuntimeRegistry>(std::make_shared<process::ProcessLifecycleManager>());
  }

  auto factory = ExecutorFactory::create(std::move(policy), options, builder);
  if (!factory) {
    return std::unexpected(factory.error());
  }
  return std::make_unique<Engine>(
      Token{}, std::move(options), std::move(builder), std::shared_ptr<ExecutorFactory>(std::move(*factory))
  );
}

auto Engine::current_factory() const -> std::shared_ptr<ExecutorFactory> {
  std::lock_guard lock(mutex_);
  return factory_;
}

auto Engine::execute(std::string const& code, std::string_view language, Timeout timeout) -> ExecutionResult {
  auto parsed = runtime::parse_language(language);
  if (!parsed) {
    auto result = failed_result(fmt::format("Unsupported language: {}", language));
    log_.record(std::string(language), code, result, true);
    return result;
  }
  return execute(CodeBlock{.content_ = code, .language_ = *parsed, .metadata_ = {}}, timeout);
}

auto Engine::execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  ExecutionResult result;
  try {
    auto backend = current_factory()->create_executor();
    core::log::info("running {} snippet on {}", runtime::to_string(code.language_), to_string(backend->kind()));
    result = backend->execute(code, timeout);
  } catch (std::exception const& e) {
    result = failed_result(fmt::format("Execution error: {}", e.what()));
  }

  log_.record(std::string(runtime::to_string(code.language_)), code.content_, result, !is_security_refusal(result));
  return result;
}

auto Engine::run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult {
  TerminalExecutionResult result;
  try {
    auto backend = current_factory()->create_executor(BackendKind::Terminal);
    result       = backend->run_command(command, timeout, interactive);
  } catch (std::exception const& e) {
    static_cast<ExecutionResult&>(result) = failed_result(fmt::format("Execution error: {}", e.what()));
    result.command_                       = command;
    result.interactive_mode_              = interactive;
  }

  log_.record("shell", command, result, result.security_validated_);
  return result;
}

auto Engine::list_supported_languages() const -> std::vector<std::string> {
  std::vector<std::string> names;
  for (auto language : current_factory()->registry()->supported()) {
    names.emplace_back(runtime::to_string(language));
  }
  return names;
}

auto Engine::list_available_languages() const -> std::vector<std::string> {
  std::vector<std::string> names;
  for (auto language : current_factory()->registry()->list_available()) {
    names.emplace_back(runtime::to_string(language));
  }
  return names;
}

auto Engine::statistics() const -> ExecutionStatistics {
  return log_.statistics();
}

auto Engine::set_policy(security::SecurityPolicy policy) -> core::Result<void> {
  auto level   = policy.level_;
  auto factory = ExecutorFactory::create(std::move(policy), options_, builder_);
  if (!factory) {
    return std::unexpected(factory.error());
  }

  std::shared_ptr<ExecutorFactory> previous;
  {
    std::lock_guard lock(mutex_);
    previous = std::exchange(factory_, std::shared_ptr<ExecutorFactory>(std::move(*factory)));
  }
  previous->cleanup_all();
  core::log::info("security policy switched to {}", security::to_string(level));
  return {};
}

auto Engine::policy() const -> security::SecurityPolicy {
  return current_factory()->policy();
}

void Engine::cleanup() {
  current_factory()->cleanup_all();
}

} // namespace xrun::exec
