#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "xrun/core/env.hpp"
#include "xrun/core/result.hpp"
#include "xrun/exec/backend.hpp"
#include "xrun/exec/container_sandbox.hpp"
#include "xrun/runtime/registry.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec {

struct FactoryOptions {
  // A backend name, or "auto" to follow EXECUTION_MODE and then the fallback chain.
  std::string                                       mode_ = "auto";
  BackendOptions                                    backend_;
  ContainerSettings                                 container_;
  std::string                                       curl_binary_ = "curl";
  std::shared_ptr<runtime::LanguageRuntimeRegistry> registry_;
};

struct ExecutorInfo {
  BackendKind kind_;
  std::string name_;
  std::string description_;
  bool        available_;
};

// Replaces how backends are constructed; the default builds the real ones.
using BackendBuilder = std::function<std::unique_ptr<Backend>(BackendKind, security::Scanner const&)>;

// Order in which backends are tried when nothing available was requested.
[[nodiscard]] auto fallback_chain(security::SecurityLevel level) -> std::vector<BackendKind>;

// Picks and caches backends for one policy. Every chain ends at the process
// sandbox, so selection always yields a usable backend.
class ExecutorFactory {
  struct Slot {
    std::mutex               mutex_;
    std::shared_ptr<Backend> backend_;
  };

  using SlotKey = std::pair<BackendKind, security::SecurityLevel>;

  // Restricts construction to create().
  struct Token {
    explicit Token() = default;
  };

  security::Scanner scanner_;
  FactoryOptions    options_;
  BackendBuilder    builder_;

  std::mutex                               mutex_;
  std::map<SlotKey, std::shared_ptr<Slot>> slots_;

  auto slot(BackendKind kind) -> std::shared_ptr<Slot>;
  auto build(BackendKind kind) -> std::unique_ptr<Backend>;

public:
  ExecutorFactory(Token, security::Scanner scanner, FactoryOptions options, BackendBuilder builder);

  // Fails when the policy does not validate.
  static auto create(security::SecurityPolicy policy, FactoryOptions options, BackendBuilder builder = {})
      -> core::Result<std::unique_ptr<ExecutorFactory>>;

  ExecutorFactory(ExecutorFactory const&)            = delete;
  ExecutorFactory& operator=(ExecutorFactory const&) = delete;

  // Requested backend if it is available, otherwise the first available one of the chain.
  auto create_executor(std::optional<BackendKind> requested = std::nullopt) -> std::shared_ptr<Backend>;

  // Cached backend of that kind, available or not.
  auto executor(BackendKind kind) -> std::shared_ptr<Backend>;

  auto executor_info(BackendKind kind) -> ExecutorInfo;
  auto available_executors() -> std::vector<BackendKind>;

  // Configured mode, then EXECUTION_MODE; none means follow the chain.
  [[nodiscard]] auto requested_kind() const -> std::optional<BackendKind>;

  // Cleans up every cached backend and empties the cache.
  void cleanup_all();

  [[nodiscard]] auto policy() const noexcept -> security::SecurityPolicy const& { return scanner_.policy(); }
  [[nodiscard]] auto registry() const noexcept -> std::shared_ptr<runtime::LanguageRuntimeRegistry> const& {
    return options_.registry_;
  }
};

[[nodiscard]] auto describe(BackendKind kind) -> std::string_view;

} // namespace xrun::exec
