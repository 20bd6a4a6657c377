#include <chrono>
#include <exception>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/exec/cloud_sandbox.hpp"
#include "xrun/exec/pipeline.hpp"
#include "xrun/exec/terminal_shell.hpp"

namespace xrun::exec {

namespace {

constexpr std::string_view REMOTE_ROOT = "/workspace";
constexpr std::chrono::seconds CLEANUP_TIMEOUT{30};

// Runs pipeline steps as commands of one remote session.
class RemoteRunner : public process::ProcessRunner {
  SandboxClient&     client_;
  std::string const& session_;

public:
  RemoteRunner(SandboxClient& client, std::string const& session)
      : client_(client), session_(session) {}

  auto run(process::RunRequest const& request) -> core::Result<process::RunOutcome> override {
    auto start  = std::chrono::steady_clock::now();
    auto remote = client_.run(session_, RemoteCommand{request.argv_, request.work_dir_.string(), request.timeout_});
    if (!remote) {
      return std::unexpected(remote.error());
    }

    process::RunOutcome outcome;
    outcome.stdout_    = std::move(remote->stdout_);
    outcome.stderr_    = std::move(remote->stderr_);
    outcome.exit_code_ = remote->exit_code_;
    outcome.timed_out_ = remote->timed_out_;
    outcome.elapsed_ =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    auto budget = request.max_output_bytes_;
    if (outcome.stdout_.size() + outcome.stderr_.size() > budget) {
      if (outcome.stdout_.size() > budget) {
        outcome.stdout_.resize(budget);
      }
      outcome.stderr_.resize(budget - outcome.stdout_.size());
      outcome.output_truncated_ = true;
    }
    return outcome;
  }
};

// Removes a per-execution session on every path out of the call.
class SessionLease {
  SandboxClient&     client_;
  std::string const& session_;
  bool               owned_;

public:
  SessionLease(SandboxClient& client, std::string const& session, bool owned)
      : client_(client), session_(session), owned_(owned) {}

  ~SessionLease() {
    if (!owned_) {
      return;
    }
    if (auto destroyed = client_.destroy_session(session_); !destroyed) {
      core::log::warn("cannot remove remote session: {}", destroyed.error());
    }
  }

  SessionLease(SessionLease const&)            = delete;
  SessionLease& operator=(SessionLease const&) = delete;
};

} // namespace

auto e2b_provider() -> CloudProvider {
  return CloudProvider{
      .kind_         = BackendKind::CloudA,
      .name_         = "e2b",
      .key_variable_ = "E2B_API_KEY",
      .url_variable_ = "E2B_API_URL",
      .template_     = "base",
      .session_      = SessionPolicy::Reuse,
  };
}

auto daytona_provider() -> CloudProvider {
  return CloudProvider{
      .kind_         = BackendKind::CloudB,
      .name_         = "daytona",
      .key_variable_ = "DAYTONA_API_KEY",
      .url_variable_ = "DAYTONA_API_URL",
      .template_     = "default",
      .session_      = SessionPolicy::PerExecution,
  };
}

auto gateway_endpoint(CloudProvider const& provider, core::env::Environment const& environment)
    -> std::optional<GatewayEndpoint> {
  auto key = environment.find(provider.key_variable_);
  auto url = environment.find(provider.url_variable_);
  if (key == environment.end() || url == environment.end() || key->second.empty() || url->second.empty()) {
    return std::nullopt;
  }
  return GatewayEndpoint{.url_ = url->second, .api_key_ = key->second};
}

CloudSandbox::CloudSandbox(
    CloudProvider                  provider,
    security::Scanner              scanner,
    std::shared_ptr<SandboxClient> client,
    BackendOptions                 options
)
    : provider_(std::move(provider))
    , scanner_(std::move(scanner))
    , client_(std::move(client))
    , options_(std::move(options)) {}

CloudSandbox::~CloudSandbox() {
  cleanup();
}

auto CloudSandbox::is_available() -> bool {
  return client_ != nullptr && client_->reachable();
}

auto CloudSandbox::session_spec() const -> SessionSpec {
  auto const& policy = scanner_.policy();
  return SessionSpec{
      .template_    = provider_.template_,
      .memory_mb_   = policy.resources_.memory_limit_mb_,
      .cpu_         = policy.resources_.cpu_limit_,
      .network_     = policy.network_ == security::NetworkPolicy::Allowed,
      .timeout_sec_ = 300,
  };
}

auto CloudSandbox::acquire_session_locked() -> core::Result<std::string> {
  if (provider_.session_ == SessionPolicy::Reuse && session_) {
    return *session_;
  }

  auto created = client_->create_session(session_spec());
  if (!created) {
    return std::unexpected(fmt::format("cannot open {} session: {}", provider_.name_, created.error()));
  }
  core::log::debug("opened {} session", provider_.name_);

  if (provider_.session_ == SessionPolicy::Reuse) {
    session_ = *created;
  }
  return created;
}

void CloudSandbox::release_session_locked(std::string const& session) {
  if (auto destroyed = client_->destroy_session(session); !destroyed) {
    core::log::warn("cannot close {} session: {}", provider_.name_, destroyed.error());
  } else {
    core::log::debug("closed {} session", provider_.name_);
  }
}

auto CloudSandbox::execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  std::string language{runtime::to_string(code.language_)};

  ExecutionResult result;
  bool            passed = true;
  try {
    if (auto refusal = security_gate(scanner_, code)) {
      passed = false;
      result = std::move(*refusal);
    } else if (!client_) {
      result = failed_result(fmt::format("{} backend is not configured", provider_.name_));
    } else {
      std::lock_guard lock(mutex_);
      result = run_code_locked(code, timeout);
    }
  } catch (std::exception const& e) {
    result = failed_result(fmt::format("Execution error: {}", e.what()));
  }

  log_.record(std::move(language), code.content_, result, passed);
  return result;
}

auto CloudSandbox::run_code_locked(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  auto const& config = runtime::config_for(code.language_);
  auto const& policy = scanner_.policy();

  auto session = acquire_session_locked();
  if (!session) {
    return failed_result(fmt::format("Execution error: {}", session.error()));
  }
  SessionLease lease(*client_, *session, provider_.session_ == SessionPolicy::PerExecution);

  // A kept session hosts many executions; each gets its own directory.
  bool        reused = provider_.session_ == SessionPolicy::Reuse;
  std::string dir    = reused ? fmt::format("{}/exec_{}", REMOTE_ROOT, ++counter_) : std::string(REMOTE_ROOT);

  auto layout = runtime::layout_for(config, code.content_);
  if (auto uploaded = client_->upload(*session, fmt::format("{}/{}", dir, layout.source_name_), code.content_);
      !uploaded) {
    // The session may have expired on the remote side; open a new one next time.
    if (reused) {
      session_.reset();
    }
    return failed_result(fmt::format("Execution error: {}", uploaded.error()));
  }

  PipelineOptions options;
  options.run_timeout_      = effective_timeout(timeout, policy, config);
  options.compile_timeout_  = options_.compile_timeout_;
  options.max_output_bytes_ = output_budget(policy);
  options.monitor_memory_   = false;

  RemoteRunner runner(*client_, *session);
  auto         result = run_steps(runner, config, layout, dir, dir, options);

  if (reused) {
    auto removed = client_->run(*session, RemoteCommand{{"rm", "-rf", dir}, std::string(REMOTE_ROOT), CLEANUP_TIMEOUT});
    if (!removed) {
      core::log::warn("cannot clear {} in {} session: {}", dir, provider_.name_, removed.error());
    }
  }
  return result;
}

auto CloudSandbox::run_command(std::string const& command, Timeout timeout, bool interactive)
    -> TerminalExecutionResult {
  TerminalExecutionResult result;
  bool                    validated = false;
  try {
    auto check = scanner_.scan_command(command);
    if (!check.is_safe_) {
      core::log::warn("command refused: {}", check.reason_);
      result = refused_command(command, interactive, check.reason_);
    } else {
      validated = true;
      if (interactive) {
        static_cast<ExecutionResult&>(result) =
            failed_result(fmt::format("Interactive mode is not available in {} sandboxes", provider_.name_));
      } else if (!client_) {
        static_cast<ExecutionResult&>(result) =
            failed_result(fmt::format("{} backend is not configured", provider_.name_));
      } else {
        auto limit = timeout.value_or(std::chrono::seconds{scanner_.policy().resources_.execution_timeout_sec_});
        std::lock_guard lock(mutex_);
        result = run_command_locked(command, limit);
      }
      result.command_          = command;
      result.interactive_mode_ = interactive;
    }
  } catch (std::exception const& e) {
    static_cast<ExecutionResult&>(result) = failed_result(fmt::format("Execution error: {}", e.what()));
    result.command_                       = command;
    result.interactive_mode_              = interactive;
  }

  log_.record("shell", command, result, validated);
  return result;
}

auto CloudSandbox::run_command_locked(std::string const& command, std::chrono::milliseconds timeout)
    -> TerminalExecutionResult {
  auto session = acquire_session_locked();
  if (!session) {
    return to_command_result(command, false, std::unexpected(session.error()), timeout, 0);
  }
  SessionLease lease(*client_, *session, provider_.session_ == SessionPolicy::PerExecution);

  process::RunRequest request;
  request.argv_             = {std::string(core::constant::SHELL_PATH), "-c", command};
  request.work_dir_         = std::string(REMOTE_ROOT);
  request.timeout_          = timeout;
  request.max_output_bytes_ = output_budget(scanner_.policy());

  RemoteRunner runner(*client_, *session);
  return to_command_result(command, false, runner.run(request), timeout, request.max_output_bytes_);
}

void CloudSandbox::cleanup() {
  std::lock_guard lock(mutex_);
  if (session_ && client_) {
    release_session_locked(*session_);
  }
  session_.reset();
}

auto CloudSandbox::statistics() const -> ExecutionStatistics {
  return log_.statistics();
}

} // namespace xrun::exec
