#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "xrun/core/result.hpp"

namespace xrun::security {

enum struct SecurityLevel {
  Strict,
  Moderate,
  Permissive,
  Custom,
};

enum struct NetworkPolicy {
  Disabled,
  Restricted,
  Allowed,
};

struct FileSystemPolicy {
  std::vector<std::string> read_only_dirs_;
  std::vector<std::string> read_write_dirs_;
  std::vector<std::string> blocked_dirs_;
  int                      max_file_size_mb_ = 100;
};

struct ResourceLimits {
  double cpu_limit_             = 1.0;
  int    memory_limit_mb_       = 512;
  int    execution_timeout_sec_ = 30;
  int    max_output_size_mb_    = 10;
  int    max_processes_         = 5;
};

struct SecurityPatterns {
  std::vector<std::string> dangerous_;
  std::vector<std::string> allowed_;
  std::vector<std::string> custom_;
};

struct TerminalSecurityPolicy {
  std::vector<std::string> dangerous_commands_;
  std::vector<std::string> allowed_commands_;
  std::vector<std::string> blocked_patterns_;
  int                      max_command_length_      = 1000;
  bool                     enable_interactive_mode_ = true;
  bool                     require_whitelist_       = false;
};

// Read-only for the duration of an execution; replaced wholesale between turns.
struct SecurityPolicy {
  SecurityLevel          level_   = SecurityLevel::Moderate;
  NetworkPolicy          network_ = NetworkPolicy::Restricted;
  FileSystemPolicy       file_system_;
  ResourceLimits         resources_;
  SecurityPatterns       patterns_;
  TerminalSecurityPolicy terminal_;
  bool                   enable_code_analysis_       = true;
  bool                   enable_security_scanning_   = true;
  bool                   enable_resource_monitoring_ = true;
  std::string            sandbox_mode_               = "auto";
};

[[nodiscard]] auto to_string(SecurityLevel level) noexcept -> std::string_view;
[[nodiscard]] auto to_string(NetworkPolicy policy) noexcept -> std::string_view;
auto parse_security_level(std::string_view name) -> core::Result<SecurityLevel>;
auto parse_network_policy(std::string_view name) -> core::Result<NetworkPolicy>;

// Built-in presets. Custom starts from the moderate preset.
auto policy_for_level(SecurityLevel level) -> SecurityPolicy;

// Collects every problem, joined with "; ".
auto validate(SecurityPolicy const& policy) -> core::Result<void>;

auto policy_to_json(SecurityPolicy const& policy) -> nlohmann::json;
auto policy_from_json(nlohmann::json const& document) -> core::Result<SecurityPolicy>;

auto read_policy(std::filesystem::path const& path) -> core::Result<SecurityPolicy>;
auto load_policy(std::filesystem::path const& path, SecurityLevel fallback) -> SecurityPolicy;
auto save_policy(SecurityPolicy const& policy, std::filesystem::path const& path) -> core::Result<void>;
auto write_policy_template(std::filesystem::path const& path, SecurityLevel level) -> core::Result<void>;

} // namespace xrun::security
