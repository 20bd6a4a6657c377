#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "xrun/core/log.hpp"
#include "xrun/exec/multi_language.hpp"
#include "xrun/exec/pipeline.hpp"

namespace xrun::exec {

MultiLanguageExecutor::MultiLanguageExecutor(
    security::Scanner                                 scanner,
    std::shared_ptr<process::ProcessRunner>           runner,
    std::shared_ptr<runtime::LanguageRuntimeRegistry> registry,
    BackendOptions                                    options
)
    : scanner_(scanner)
    , runner_(runner)
    , registry_(std::move(registry))
    , options_(std::move(options))
    , shell_(std::move(scanner), std::move(runner), options_.work_dir_, options_.inherited_env_) {}

auto MultiLanguageExecutor::execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  std::string language{runtime::to_string(code.language_)};

  ExecutionResult result;
  bool            passed = true;
  try {
    auto config = registry_->get_config(code.language_);
    if (auto refusal = security_gate(scanner_, code)) {
      passed = false;
      result = std::move(*refusal);
    } else if (!config || !registry_->is_available(code.language_)) {
      core::log::info("no {} runtime on this host", language);
      result = failed_result(fmt::format("Language '{}' is not available on this host", language));
    } else {
      auto options              = pipeline_options(scanner_.policy(), *config, timeout, options_, true);
      options.workspace_prefix_ = "xrun_native_";
      result                    = run_pipeline(*runner_, *config, code.content_, options);
    }
  } catch (std::exception const& e) {
    result = failed_result(fmt::format("Execution error: {}", e.what()));
  }

  log_.record(std::move(language), code.content_, result, passed);
  return result;
}

auto MultiLanguageExecutor::run_command(std::string const& command, Timeout timeout, bool interactive)
    -> TerminalExecutionResult {
  return shell_.run_command(command, timeout, interactive);
}

void MultiLanguageExecutor::cleanup() {
  runner_->terminate_all();
}

auto MultiLanguageExecutor::statistics() const -> ExecutionStatistics {
  return log_.statistics();
}

} // namespace xrun::exec
