#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "xrun/core/env.hpp"
#include "xrun/exec/backend.hpp"
#include "xrun/exec/execution_log.hpp"
#include "xrun/exec/sandbox_client.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec {

enum struct SessionPolicy {
  // One session kept open and used by one execution at a time.
  Reuse,
  // A fresh session per execution, removed when it ends.
  PerExecution,
};

struct CloudProvider {
  BackendKind   kind_;
  std::string   name_;
  std::string   key_variable_;
  std::string   url_variable_;
  std::string   template_;
  SessionPolicy session_;
};

[[nodiscard]] auto e2b_provider() -> CloudProvider;
[[nodiscard]] auto daytona_provider() -> CloudProvider;

// Endpoint of the provider from the environment; none unless both variables are set.
auto gateway_endpoint(CloudProvider const& provider, core::env::Environment const& environment)
    -> std::optional<GatewayEndpoint>;

class CloudSandbox : public Backend {
  CloudProvider                  provider_;
  security::Scanner              scanner_;
  std::shared_ptr<SandboxClient> client_;
  BackendOptions                 options_;
  ExecutionLog                   log_;

  // Serializes use of the remote session.
  std::mutex                 mutex_;
  std::optional<std::string> session_;
  unsigned                   counter_ = 0;

  auto session_spec() const -> SessionSpec;
  auto run_code_locked(CodeBlock const& code, Timeout timeout) -> ExecutionResult;
  auto run_command_locked(std::string const& command, std::chrono::milliseconds timeout) -> TerminalExecutionResult;
  auto acquire_session_locked() -> core::Result<std::string>;
  void release_session_locked(std::string const& session);

public:
  // A null client makes the backend unavailable.
  CloudSandbox(
      CloudProvider                  provider,
      security::Scanner              scanner,
      std::shared_ptr<SandboxClient> client,
      BackendOptions                 options
  );
  ~CloudSandbox() override;

  CloudSandbox(CloudSandbox const&)            = delete;
  CloudSandbox& operator=(CloudSandbox const&) = delete;

  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return provider_.kind_; }
  [[nodiscard]] auto is_available() -> bool override;

  auto execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult override;

  // Commands run through /bin/sh in the remote session; interactive mode is not offered.
  auto run_command(std::string const& command, Timeout timeout, bool interactive) -> TerminalExecutionResult override;

  // Closes a kept session. Safe to call repeatedly.
  void cleanup() override;

  [[nodiscard]] auto statistics() const -> ExecutionStatistics override;
};

} // namespace xrun::exec
