#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "xrun/core/log.hpp"
#include "xrun/core/string_utils.hpp"
#include "xrun/security/policy.hpp"

namespace xrun::security {

namespace {

using json = nlohmann::json;

// Standard C and C++ headers count as safe imports for compiled snippets.
constexpr std::string_view STD_HEADER_PATTERN =
    R"(#\s*include\s*<\s*(iostream|iomanip|sstream|string|string_view|vector|array|map|unordered_map|set|)"
    R"(unordered_set|list|deque|queue|stack|algorithm|numeric|cmath|cstdio|cstdlib|cstring|cstdint|)"
    R"(utility|tuple|optional|functional|limits|chrono|stdio\.h|stdlib\.h|string\.h|math\.h|)"
    R"(stdbool\.h|stdint\.h|ctype\.h|limits\.h)\s*>)";

auto strict_policy() -> SecurityPolicy {
  SecurityPolicy policy;
  policy.level_   = SecurityLevel::Strict;
  policy.network_ = NetworkPolicy::Disabled;

  policy.file_system_ = FileSystemPolicy{
      .read_only_dirs_   = {"/usr/lib", "/lib"},
      .read_write_dirs_  = {"/tmp"},
      .blocked_dirs_     = {"/etc", "/root", "/home", "/var", "/opt"},
      .max_file_size_mb_ = 50,
  };

  policy.resources_ = ResourceLimits{
      .cpu_limit_             = 0.5,
      .memory_limit_mb_       = 256,
      .execution_timeout_sec_ = 15,
      .max_output_size_mb_    = 5,
      .max_processes_         = 2,
  };

  // clang-format off
  policy.patterns_.dangerous_ = {
      R"(import\s+os)",            R"(import\s+subprocess)",  R"(import\s+socket)",
      R"(import\s+urllib)",        R"(import\s+requests)",    R"(os\.system\s*\()",
      R"(os\.popen\s*\()",         R"(subprocess\.run\s*\()", R"(subprocess\.call\s*\()",
      R"(subprocess\.Popen\s*\()", R"(open\s*\()",            R"(file\s*\()",
      R"(exec\s*\()",              R"(eval\s*\()",            R"(__import__\s*\()",
      R"(compile\s*\()",
  };
  policy.patterns_.allowed_ = {
      R"(import\s+math)",             R"(import\s+random)",            R"(import\s+datetime)",
      R"(import\s+json)",             R"(import\s+collections)",       R"(import\s+itertools)",
      R"(import\s+functools)",        R"(from\s+math\s+import)",       R"(from\s+random\s+import)",
      R"(from\s+datetime\s+import)",  R"(from\s+json\s+import)",       R"(from\s+collections\s+import)",
      R"(from\s+itertools\s+import)", R"(from\s+functools\s+import)",  std::string{STD_HEADER_PATTERN},
  };

  policy.terminal_ = TerminalSecurityPolicy{
      .dangerous_commands_ = {
          "rm", "del", "format", "fdisk", "mkfs", "dd", "shred",
          "sudo", "su", "doas", "passwd", "chmod", "chown", "mount", "umount",
          "kill", "killall", "pkill", "xkill", "halt", "shutdown", "reboot",
          "curl", "wget", "nc", "netcat", "telnet", "ssh", "scp", "rsync",
          "crontab", "at", "systemctl", "service", "initctl", "useradd",
          "userdel", "groupadd", "groupdel", "visudo", "chroot",
      },
      .allowed_commands_ = {
          "ls", "dir", "pwd", "cat", "type", "head", "tail", "grep",
          "find", "which", "where", "echo", "print", "date", "time",
          "git", "npm", "pip", "python", "node", "java", "gcc", "g++",
          "make", "cmake", "ps", "top", "htop", "df", "du", "free",
          "uptime", "uname", "mkdir", "touch", "cp", "copy", "mv", "move",
          "wc", "sort", "uniq",
      },
      .blocked_patterns_ = {
          R"(\|\s*rm\s+)",  R"(\|\s*del\s+)",  R"(\|\s*sudo\s+)", R"(\|\s*su\s+)",
          R"(&&\s*rm\s+)",  R"(&&\s*del\s+)",  R"(&&\s*sudo\s+)", R"(&&\s*su\s+)",
          R"(;\s*rm\s+)",   R"(;\s*del\s+)",   R"(;\s*sudo\s+)",  R"(;\s*su\s+)",
          R"(\|\s*kill\s+)", R"(&&\s*kill\s+)", R"(;\s*kill\s+)",
      },
      .max_command_length_      = 500,
      .enable_interactive_mode_ = false,
      .require_whitelist_       = true,
  };
  // clang-format on

  return policy;
}

auto moderate_policy() -> SecurityPolicy {
  SecurityPolicy policy;
  policy.level_   = SecurityLevel::Moderate;
  policy.network_ = NetworkPolicy::Restricted;

  policy.file_system_ = FileSystemPolicy{
      .read_only_dirs_   = {"/usr/lib"},
      .read_write_dirs_  = {"/tmp"},
      .blocked_dirs_     = {"/etc", "/root", "/home"},
      .max_file_size_mb_ = 100,
  };

  policy.resources_ = ResourceLimits{};

  // clang-format off
  policy.patterns_.dangerous_ = {
      R"(import\s+os)",          R"(import\s+subprocess)", R"(import\s+socket)",
      R"(os\.system\s*\()",      R"(subprocess\.run\s*\()", R"(open\s*\()",
      R"(exec\s*\()",            R"(eval\s*\()",
  };
  policy.patterns_.allowed_ = {
      R"(import\s+math)",          R"(import\s+random)",          R"(import\s+datetime)",
      R"(import\s+json)",          R"(import\s+collections)",     R"(from\s+math\s+import)",
      R"(from\s+random\s+import)", R"(from\s+datetime\s+import)", R"(from\s+json\s+import)",
      std::string{STD_HEADER_PATTERN},
  };

  policy.terminal_ = TerminalSecurityPolicy{
      .dangerous_commands_ = {
          "rm", "del", "format", "fdisk", "mkfs", "dd", "shred",
          "sudo", "su", "doas", "passwd", "chmod", "chown", "mount", "umount",
          "kill", "killall", "pkill", "xkill", "halt", "shutdown", "reboot",
          "curl", "wget", "nc", "netcat", "telnet", "ssh", "scp", "rsync",
          "crontab", "at", "systemctl", "service", "initctl",
      },
      .allowed_commands_ = {
          "ls", "dir", "pwd", "cd", "cat", "type", "head", "tail", "grep",
          "find", "which", "where", "echo", "print", "date", "time", "whoami",
          "git", "npm", "pip", "python", "node", "java", "gcc", "g++",
          "make", "cmake", "docker", "kubectl", "terraform", "ansible",
          "ps", "top", "htop", "df", "du", "free", "uptime", "uname",
          "mkdir", "touch", "cp", "copy", "mv", "move", "ln", "link",
      },
      .blocked_patterns_ = {
          R"(\|\s*rm\s+)", R"(\|\s*del\s+)", R"(\|\s*sudo\s+)", R"(\|\s*su\s+)",
          R"(&&\s*rm\s+)", R"(&&\s*del\s+)", R"(&&\s*sudo\s+)", R"(&&\s*su\s+)",
          R"(;\s*rm\s+)",  R"(;\s*del\s+)",  R"(;\s*sudo\s+)",  R"(;\s*su\s+)",
      },
      .max_command_length_      = 1000,
      .enable_interactive_mode_ = true,
      .require_whitelist_       = false,
  };
  // clang-format on

  return policy;
}

auto permissive_policy() -> SecurityPolicy {
  SecurityPolicy policy;
  policy.level_   = SecurityLevel::Permissive;
  policy.network_ = NetworkPolicy::Allowed;

  policy.file_system_ = FileSystemPolicy{
      .read_only_dirs_   = {},
      .read_write_dirs_  = {"/tmp"},
      .blocked_dirs_     = {"/etc/passwd", "/etc/shadow"},
      .max_file_size_mb_ = 500,
  };

  policy.resources_ = ResourceLimits{
      .cpu_limit_             = 2.0,
      .memory_limit_mb_       = 1024,
      .execution_timeout_sec_ = 60,
      .max_output_size_mb_    = 50,
      .max_processes_         = 10,
  };

  // clang-format off
  policy.patterns_.dangerous_ = {
      R"(import\s+subprocess)",     R"(subprocess\.run\s*\()", R"(subprocess\.call\s*\()",
      R"(subprocess\.Popen\s*\()", R"(exec\s*\()",            R"(eval\s*\()",
  };

  policy.terminal_ = TerminalSecurityPolicy{
      .dangerous_commands_ = {"format", "fdisk", "mkfs", "dd", "shred", "halt", "shutdown", "reboot"},
      .allowed_commands_   = {},
      .blocked_patterns_   = {
          R"(\|\s*format\s+)", R"(\|\s*fdisk\s+)", R"(\|\s*mkfs\s+)",
          R"(&&\s*format\s+)", R"(&&\s*fdisk\s+)", R"(&&\s*mkfs\s+)",
          R"(;\s*format\s+)",  R"(;\s*fdisk\s+)",  R"(;\s*mkfs\s+)",
      },
      .max_command_length_      = 2000,
      .enable_interactive_mode_ = true,
      .require_whitelist_       = false,
  };
  // clang-format on

  return policy;
}

void check_patterns(
    std::vector<std::string> const& patterns,
    std::string_view                group,
    std::vector<std::string>&       problems
) {
  for (auto const& pattern : patterns) {
    try {
      std::regex compiled(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (std::regex_error const& e) {
      problems.push_back(fmt::format("invalid {} pattern '{}': {}", group, pattern, e.what()));
    }
  }
}

template<typename T>
void read_field(json const& object, char const* key, T& target) {
  if (auto it = object.find(key); it != object.end() && !it->is_null()) {
    target = it->template get<T>();
  }
}

auto read_cpu_limit(json const& value) -> double {
  if (value.is_string()) {
    return std::stod(value.get<std::string>());
  }
  return value.get<double>();
}

} // namespace

auto to_string(SecurityLevel level) noexcept -> std::string_view {
  switch (level) {
    case SecurityLevel::Strict: return "strict";
    case SecurityLevel::Moderate: return "moderate";
    case SecurityLevel::Permissive: return "permissive";
    case SecurityLevel::Custom: return "custom";
  }
  return "moderate";
}

auto to_string(NetworkPolicy policy) noexcept -> std::string_view {
  switch (policy) {
    case NetworkPolicy::Disabled: return "disabled";
    case NetworkPolicy::Restricted: return "restricted";
    case NetworkPolicy::Allowed: return "allowed";
  }
  return "restricted";
}

auto parse_security_level(std::string_view name) -> core::Result<SecurityLevel> {
  auto lowered = core::util::to_lower(core::util::trim(name));
  if (lowered == "strict") {
    return SecurityLevel::Strict;
  }
  if (lowered == "moderate") {
    return SecurityLevel::Moderate;
  }
  if (lowered == "permissive") {
    return SecurityLevel::Permissive;
  }
  if (lowered == "custom") {
    return SecurityLevel::Custom;
  }
  return std::unexpected(fmt::format("Unknown security level: '{}'", name));
}

auto parse_network_policy(std::string_view name) -> core::Result<NetworkPolicy> {
  auto lowered = core::util::to_lower(core::util::trim(name));
  if (lowered == "disabled") {
    return NetworkPolicy::Disabled;
  }
  if (lowered == "restricted") {
    return NetworkPolicy::Restricted;
  }
  if (lowered == "allowed") {
    return NetworkPolicy::Allowed;
  }
  return std::unexpected(fmt::format("Unknown network policy: '{}'", name));
}

auto policy_for_level(SecurityLevel level) -> SecurityPolicy {
  switch (level) {
    case SecurityLevel::Strict: return strict_policy();
    case SecurityLevel::Permissive: return permissive_policy();
    case SecurityLevel::Custom: {
      auto policy   = moderate_policy();
      policy.level_ = SecurityLevel::Custom;
      return policy;
    }
    case SecurityLevel::Moderate: break;
  }
  return moderate_policy();
}

auto validate(SecurityPolicy const& policy) -> core::Result<void> {
  std::vector<std::string> problems;

  auto const& limits = policy.resources_;
  if (limits.memory_limit_mb_ <= 0) {
    problems.emplace_back("memory limit must be positive");
  }
  if (limits.execution_timeout_sec_ <= 0) {
    problems.emplace_back("execution timeout must be positive");
  }
  if (limits.max_output_size_mb_ <= 0) {
    problems.emplace_back("max output size must be positive");
  }
  if (limits.max_processes_ <= 0) {
    problems.emplace_back("max processes must be positive");
  }
  if (!(limits.cpu_limit_ > 0.0)) {
    problems.emplace_back("cpu limit must be positive");
  }
  if (policy.file_system_.max_file_size_mb_ <= 0) {
    problems.emplace_back("max file size must be positive");
  }
  if (policy.terminal_.max_command_length_ <= 0) {
    problems.emplace_back("max command length must be positive");
  }
  if (policy.level_ != SecurityLevel::Permissive && policy.patterns_.dangerous_.empty()) {
    problems.emplace_back("dangerous patterns must not be empty unless the level is permissive");
  }

  check_patterns(policy.patterns_.dangerous_, "dangerous", problems);
  check_patterns(policy.patterns_.allowed_, "allowed", problems);
  check_patterns(policy.patterns_.custom_, "custom", problems);
  check_patterns(policy.terminal_.blocked_patterns_, "blocked command", problems);

  if (!problems.empty()) {
    return std::unexpected(core::util::join(problems, "; "));
  }
  return {};
}

auto policy_to_json(SecurityPolicy const& policy) -> nlohmann::json {
  // clang-format off
  return json{
    {"security_level", to_string(policy.level_)},
    {"network_policy", to_string(policy.network_)},
    {"file_system", {
      {"read_only_dirs", policy.file_system_.read_only_dirs_},
      {"read_write_dirs", policy.file_system_.read_write_dirs_},
      {"blocked_dirs", policy.file_system_.blocked_dirs_},
      {"max_file_size_mb", policy.file_system_.max_file_size_mb_},
    }},
    {"resource_limits", {
      {"cpu_limit", policy.resources_.cpu_limit_},
      {"memory_limit_mb", policy.resources_.memory_limit_mb_},
      {"execution_timeout", policy.resources_.execution_timeout_sec_},
      {"max_output_size_mb", policy.resources_.max_output_size_mb_},
      {"max_processes", policy.resources_.max_processes_},
    }},
    {"patterns", {
      {"dangerous_patterns", policy.patterns_.dangerous_},
      {"allowed_patterns", policy.patterns_.allowed_},
      {"custom_patterns", policy.patterns_.custom_},
    }},
    {"terminal_security", {
      {"dangerous_commands", policy.terminal_.dangerous_commands_},
      {"allowed_commands", policy.terminal_.allowed_commands_},
      {"blocked_patterns", policy.terminal_.blocked_patterns_},
      {"max_command_length", policy.terminal_.max_command_length_},
      {"enable_interactive_mode", policy.terminal_.enable_interactive_mode_},
      {"require_command_whitelist", policy.terminal_.require_whitelist_},
    }},
    {"enable_code_analysis", policy.enable_code_analysis_},
    {"enable_security_scanning", policy.enable_security_scanning_},
    {"enable_resource_monitoring", policy.enable_resource_monitoring_},
    {"sandbox_mode", policy.sandbox_mode_},
  };
  // clang-format on
}

auto policy_from_json(nlohmann::json const& document) -> core::Result<SecurityPolicy> {
  if (!document.is_object()) {
    return std::unexpected(std::string{"policy document must be a JSON object"});
  }

  auto level = SecurityLevel::Moderate;
  if (auto it = document.find("security_level"); it != document.end() && it->is_string()) {
    auto parsed = parse_security_level(it->get<std::string>());
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    level = *parsed;
  }

  // Absent fields inherit the preset of the declared level.
  SecurityPolicy policy = policy_for_level(level);

  try {
    if (auto it = document.find("network_policy"); it != document.end() && it->is_string()) {
      auto parsed = parse_network_policy(it->get<std::string>());
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      policy.network_ = *parsed;
    }

    if (auto it = document.find("file_system"); it != document.end() && it->is_object()) {
      read_field(*it, "read_only_dirs", policy.file_system_.read_only_dirs_);
      read_field(*it, "read_write_dirs", policy.file_system_.read_write_dirs_);
      read_field(*it, "blocked_dirs", policy.file_system_.blocked_dirs_);
      read_field(*it, "max_file_size_mb", policy.file_system_.max_file_size_mb_);
    }

    if (auto it = document.find("resource_limits"); it != document.end() && it->is_object()) {
      if (auto cpu = it->find("cpu_limit"); cpu != it->end() && !cpu->is_null()) {
        policy.resources_.cpu_limit_ = read_cpu_limit(*cpu);
      }
      read_field(*it, "memory_limit_mb", policy.resources_.memory_limit_mb_);
      read_field(*it, "execution_timeout", policy.resources_.execution_timeout_sec_);
      read_field(*it, "max_output_size_mb", policy.resources_.max_output_size_mb_);
      read_field(*it, "max_processes", policy.resources_.max_processes_);
    }

    if (auto it = document.find("patterns"); it != document.end() && it->is_object()) {
      read_field(*it, "dangerous_patterns", policy.patterns_.dangerous_);
      read_field(*it, "allowed_patterns", policy.patterns_.allowed_);
      read_field(*it, "custom_patterns", policy.patterns_.custom_);
    }

    if (auto it = document.find("terminal_security"); it != document.end() && it->is_object()) {
      read_field(*it, "dangerous_commands", policy.terminal_.dangerous_commands_);
      read_field(*it, "allowed_commands", policy.terminal_.allowed_commands_);
      read_field(*it, "blocked_patterns", policy.terminal_.blocked_patterns_);
      read_field(*it, "max_command_length", policy.terminal_.max_command_length_);
      read_field(*it, "enable_interactive_mode", policy.terminal_.enable_interactive_mode_);
      read_field(*it, "require_command_whitelist", policy.terminal_.require_whitelist_);
    }

    read_field(document, "enable_code_analysis", policy.enable_code_analysis_);
    read_field(document, "enable_security_scanning", policy.enable_security_scanning_);
    read_field(document, "enable_resource_monitoring", policy.enable_resource_monitoring_);
    read_field(document, "sandbox_mode", policy.sandbox_mode_);
  } catch (json::exception const& e) {
    return std::unexpected(fmt::format("malformed policy field: {}", e.what()));
  } catch (std::logic_error const& e) {
    return std::unexpected(fmt::format("malformed cpu_limit: {}", e.what()));
  }

  if (auto valid = validate(policy); !valid) {
    return std::unexpected(fmt::format("invalid policy: {}", valid.error()));
  }
  return policy;
}

auto read_policy(std::filesystem::path const& path) -> core::Result<SecurityPolicy> {
  std::ifstream input(path);
  if (!input) {
    return std::unexpected(fmt::format("cannot open policy file '{}'", path.string()));
  }

  json document = json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    return std::unexpected(fmt::format("policy file '{}' is not valid JSON", path.string()));
  }
  return policy_from_json(document);
}

auto load_policy(std::filesystem::path const& path, SecurityLevel fallback) -> SecurityPolicy {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    core::log::debug("policy file '{}' not found, using the {} preset", path.string(), to_string(fallback));
    return policy_for_level(fallback);
  }

  auto loaded = read_policy(path);
  if (!loaded) {
    core::log::warn("could not load security policy: {}; using the {} preset", loaded.error(), to_string(fallback));
    return policy_for_level(fallback);
  }
  return *std::move(loaded);
}

auto save_policy(SecurityPolicy const& policy, std::filesystem::path const& path) -> core::Result<void> {
  std::ofstream output(path, std::ios::trunc);
  if (!output) {
    return std::unexpected(fmt::format("cannot write policy file '{}'", path.string()));
  }

  output << policy_to_json(policy).dump(2) << '\n';
  if (!output) {
    return std::unexpected(fmt::format("failed writing policy file '{}'", path.string()));
  }
  core::log::info("security policy saved to {}", path.string());
  return {};
}

auto write_policy_template(std::filesystem::path const& path, SecurityLevel level) -> core::Result<void> {
  return save_policy(policy_for_level(level), path);
}

} // namespace xrun::security
