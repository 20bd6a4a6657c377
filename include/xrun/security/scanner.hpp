#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "xrun/core/result.hpp"
#include "xrun/security/policy.hpp"

namespace xrun::security {

struct SecurityCheckResult {
  bool                     is_safe_ = true;
  std::string              reason_;
  std::vector<std::string> violated_patterns_;

  [[nodiscard]] static auto safe(std::string reason) -> SecurityCheckResult;
  [[nodiscard]] static auto unsafe(std::string reason, std::vector<std::string> patterns = {}) -> SecurityCheckResult;
};

// Commands moderate policies still refuse even though they tolerate the rest of the dangerous list.
[[nodiscard]] auto is_privileged_command(std::string_view base_command) noexcept -> bool;

class Scanner {
  struct CompiledPattern {
    std::string source_;
    std::regex  regex_;
  };

  SecurityPolicy               policy_;
  std::vector<CompiledPattern> dangerous_;
  std::vector<CompiledPattern> allowed_;
  std::vector<CompiledPattern> blocked_commands_;

  explicit Scanner(SecurityPolicy policy);

public:
  // Fails when a pattern of the policy is not a valid regular expression.
  static auto compile(SecurityPolicy policy) -> core::Result<Scanner>;

  [[nodiscard]] auto scan_code(std::string_view content, std::string_view language) const -> SecurityCheckResult;
  [[nodiscard]] auto scan_command(std::string_view command_line) const -> SecurityCheckResult;

  [[nodiscard]] auto policy() const noexcept -> SecurityPolicy const& { return policy_; }
};

// True when the snippet pulls in a module, package or header for its language.
[[nodiscard]] auto contains_import(std::string_view content, std::string_view language) -> bool;

} // namespace xrun::security
