#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "xrun/core/log.hpp"
#include "xrun/exec/pipeline.hpp"
#include "xrun/exec/process_sandbox.hpp"

namespace xrun::exec {

ProcessSandbox::ProcessSandbox(
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

auto ProcessSandbox::execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  std::string language{runtime::to_string(code.language_)};

  ExecutionResult result;
  bool            passed = true;
  try {
    if (auto refusal = security_gate(scanner_, code)) {
      passed = false;
      result = std::move(*refusal);
    } else if (!registry_->is_available(code.language_)) {
      core::log::info("no {} runtime on this host", language);
      result = failed_result(fmt::format("Language '{}' is not available on this host", language));
    } else {
      auto const& config = runtime::config_for(code.language_);

      auto options              = pipeline_options(scanner_.policy(), config, timeout, options_, false);
      options.workspace_prefix_ = "xrun_sandbox_";
      result                    = run_pipeline(*runner_, config, code.content_, options);
    }
  } catch (std::exception const& e) {
    result = failed_result(fmt::format("Execution error: {}", e.what()));
  }

  log_.record(std::move(language), code.content_, result, passed);
  return result;
}

auto ProcessSandbox::run_command(std::string const& command, Timeout timeout, bool interactive)
    -> TerminalExecutionResult {
  return shell_.run_command(command, timeout, interactive);
}

void ProcessSandbox::cleanup() {
  runner_->terminate_all();
}

auto ProcessSandbox::statistics() const -> ExecutionStatistics {
  return log_.statistics();
}

} // namespace xrun::exec
