#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/exec/cloud_sandbox.hpp"
#include "xrun/exec/container_sandbox.hpp"
#include "xrun/exec/factory.hpp"
#include "xrun/exec/multi_language.hpp"
#include "xrun/exec/process_sandbox.hpp"
#include "xrun/exec/sandbox_client.hpp"
#include "xrun/exec/terminal_shell.hpp"
#include "xrun/process/lifecycle.hpp"

namespace xrun::exec {

auto fallback_chain(security::SecurityLevel level) -> std::vector<BackendKind> {
  using enum BackendKind;
  switch (level) {
    case security::SecurityLevel::Strict: return {CloudB, CloudA, Container, Process};
    case security::SecurityLevel::Moderate: return {Container, CloudB, CloudA, Process};
    case security::SecurityLevel::Permissive:
    case security::SecurityLevel::Custom: return {Native, Process};
  }
  return {Process};
}

auto describe(BackendKind kind) -> std::string_view {
  switch (kind) {
    case BackendKind::Process: return "Local process sandbox with resource limits";
    case BackendKind::Container: return "Docker container per execution";
    case BackendKind::CloudA: return "E2B cloud sandbox, one session reused";
    case BackendKind::CloudB: return "Daytona cloud sandbox, one session per execution";
    case BackendKind::Native: return "Toolchains installed on this host";
    case BackendKind::Terminal: return "Shell commands through /bin/sh";
  }
  return "";
}

ExecutorFactory::ExecutorFactory(Token, security::Scanner scanner, FactoryOptions options, BackendBuilder builder)
    : scanner_(std::move(scanner)), options_(std::move(options)), builder_(std::move(builder)) {
  if (!options_.registry_) {
    options_.registry_ =
        std::make_shared<runtime::LanguageRuntimeRegistry>(std::make_shared<process::ProcessLifecycleManager>());
  }
}

auto ExecutorFactory::create(security::SecurityPolicy policy, FactoryOptions options, BackendBuilder builder)
    -> core::Result<std::unique_ptr<ExecutorFactory>> {
  if (auto valid = security::validate(policy); !valid) {
    return std::unexpected(fmt::format("invalid security policy: {}", valid.error()));
  }
  auto scanner = security::Scanner::compile(std::move(policy));
  if (!scanner) {
    return std::unexpected(scanner.error());
  }
  return std::make_unique<ExecutorFactory>(Token{}, std::move(*scanner), std::move(options), std::move(builder));
}

auto ExecutorFactory::build(BackendKind kind) -> std::unique_ptr<Backend> {
  if (builder_) {
    return builder_(kind, scanner_);
  }

  // Each backend owns its runner so cleaning one up leaves the others' processes alone.
  auto runner = std::make_shared<process::ProcessLifecycleManager>();

  switch (kind) {
    case BackendKind::Process:
      return std::make_unique<ProcessSandbox>(scanner_, runner, options_.registry_, options_.backend_);
    case BackendKind::Native:
      return std::make_unique<MultiLanguageExecutor>(scanner_, runner, options_.registry_, options_.backend_);
    case BackendKind::Terminal:
      return std::make_unique<TerminalShell>(
          scanner_, runner, options_.backend_.work_dir_, options_.backend_.inherited_env_
      );
    case BackendKind::Container:
      return std::make_unique<ContainerSandbox>(scanner_, runner, options_.container_, options_.backend_);
    case BackendKind::CloudA:
    case BackendKind::CloudB: {
      auto provider = kind == BackendKind::CloudA ? e2b_provider() : daytona_provider();

      std::shared_ptr<SandboxClient> client;
      if (auto endpoint = gateway_endpoint(provider, options_.backend_.inherited_env_)) {
        client = std::make_shared<CurlGatewayClient>(runner, std::move(*endpoint), options_.curl_binary_);
      } else {
        core::log::debug("{} credentials not set", provider.name_);
      }
      return std::make_unique<CloudSandbox>(std::move(provider), scanner_, std::move(client), options_.backend_);
    }
  }
  return std::make_unique<ProcessSandbox>(scanner_, runner, options_.registry_, options_.backend_);
}

auto ExecutorFactory::slot(BackendKind kind) -> std::shared_ptr<Slot> {
  std::lock_guard lock(mutex_);
  auto&           entry = slots_[SlotKey{kind, scanner_.policy().level_}];
  if (!entry) {
    entry = std::make_shared<Slot>();
  }
  return entry;
}

auto ExecutorFactory::executor(BackendKind kind) -> std::shared_ptr<Backend> {
  auto entry = slot(kind);

  // Creation is serialized per key; other keys proceed in parallel.
  std::lock_guard lock(entry->mutex_);
  if (!entry->backend_) {
    entry->backend_ = build(kind);
    core::log::debug("created {} backend", to_string(kind));
  }
  return entry->backend_;
}

auto ExecutorFactory::requested_kind() const -> std::optional<BackendKind> {
  std::string mode = options_.mode_;
  if (mode.empty() || mode == "auto") {
    auto const& environment = options_.backend_.inherited_env_;
    auto        it          = environment.find(std::string(core::constant::ENV_EXECUTION_MODE));
    if (it == environment.end()) {
      return std::nullopt;
    }
    mode = it->second;
  }
  if (mode.empty() || mode == "auto") {
    return std::nullopt;
  }

  auto kind = parse_backend_kind(mode);
  if (!kind) {
    core::log::warn("{}, selecting automatically", kind.error());
    return std::nullopt;
  }
  return *kind;
}

auto ExecutorFactory::create_executor(std::optional<BackendKind> requested) -> std::shared_ptr<Backend> {
  if (!requested) {
    requested = requested_kind();
  }

  if (requested) {
    auto backend = executor(*requested);
    if (backend->is_available()) {
      return backend;
    }
    core::log::warn("{} backend unavailable, falling back", to_string(*requested));
  }

  for (auto kind : fallback_chain(scanner_.policy().level_)) {
    if (requested && kind == *requested) {
      continue;
    }
    auto backend = executor(kind);
    if (backend->is_available()) {
      core::log::debug("selected {} backend", to_string(kind));
      return backend;
    }
    core::log::debug("{} backend unavailable", to_string(kind));
  }
  return executor(BackendKind::Process);
}

auto ExecutorFactory::executor_info(BackendKind kind) -> ExecutorInfo {
  auto backend = executor(kind);
  return ExecutorInfo{
      .kind_        = kind,
      .name_        = std::string(to_string(kind)),
      .description_ = std::string(describe(kind)),
      .available_   = backend->is_available(),
  };
}

auto ExecutorFactory::available_executors() -> std::vector<BackendKind> {
  std::vector<BackendKind> available;
  for (auto kind : {BackendKind::Process, BackendKind::Container, BackendKind::CloudA, BackendKind::CloudB,
                    BackendKind::Native, BackendKind::Terminal}) {
    if (executor(kind)->is_available()) {
      available.push_back(kind);
    }
  }
  return available;
}

void ExecutorFactory::cleanup_all() {
  std::map<SlotKey, std::shared_ptr<Slot>> slots;
  {
    std::lock_guard lock(mutex_);
    slots.swap(slots_);
  }

  for (auto& [key, entry] : slots) {
    std::lock_guard lock(entry->mutex_);
    if (entry->backend_) {
      entry->backend_->cleanup();
      core::log::debug("cleaned up {} backend", to_string(key.first));
    }
  }
}

} // namespace xrun::exec
