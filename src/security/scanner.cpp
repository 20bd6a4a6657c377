#include <algorithm>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "xrun/core/string_utils.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::security {

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

constexpr std::string_view UNSAFE_IMPORT = "Unsafe import detected";

auto import_pattern_for(std::string_view language) -> std::string_view {
  auto lang = core::util::to_lower(language);
  if (lang == "python" || lang == "py") {
    return R"((^|\n)\s*(import\s+\w|from\s+[\w.]+\s+import\b)|__import__\s*\()";
  }
  if (lang == "javascript" || lang == "js" || lang == "typescript" || lang == "ts") {
    return R"((^|\n)\s*import\b|\brequire\s*\()";
  }
  if (lang == "java" || lang == "go" || lang == "golang") {
    return R"((^|\n)\s*import\b)";
  }
  if (lang == "c" || lang == "cpp" || lang == "c++") {
    return R"((^|\n)\s*#\s*include\b)";
  }
  if (lang == "rust") {
    return R"((^|\n)\s*(use|extern\s+crate)\s)";
  }
  if (lang == "php" || lang == "ruby" || lang == "perl") {
    return R"((^|\n)\s*(require|require_once|include|include_once|use)\b)";
  }
  // Unknown languages fall back to the plain keyword check.
  return R"(\bimport\b)";
}

} // namespace

auto SecurityCheckResult::safe(std::string reason) -> SecurityCheckResult {
  return SecurityCheckResult{true, std::move(reason), {}};
}

auto SecurityCheckResult::unsafe(std::string reason, std::vector<std::string> patterns) -> SecurityCheckResult {
  return SecurityCheckResult{false, std::move(reason), std::move(patterns)};
}

auto is_privileged_command(std::string_view base_command) noexcept -> bool {
  constexpr std::string_view PRIVILEGED[] = {"sudo", "su", "doas", "kill", "killall", "pkill"};
  return std::ranges::find(PRIVILEGED, base_command) != std::end(PRIVILEGED);
}

auto contains_import(std::string_view content, std::string_view language) -> bool {
  std::regex pattern{std::string{import_pattern_for(language)}, REGEX_FLAGS};
  return std::regex_search(content.begin(), content.end(), pattern);
}

Scanner::Scanner(SecurityPolicy policy)
    : policy_(std::move(policy)) {}

auto Scanner::compile(SecurityPolicy policy) -> core::Result<Scanner> {
  Scanner scanner{std::move(policy)};

  auto add = [](std::vector<CompiledPattern>& target, std::vector<std::string> const& sources) -> core::Result<void> {
    for (auto const& source : sources) {
      try {
        target.push_back(CompiledPattern{source, std::regex{source, REGEX_FLAGS}});
      } catch (std::regex_error const& e) {
        return std::unexpected(fmt::format("invalid pattern '{}': {}", source, e.what()));
      }
    }
    return {};
  };

  auto const& patterns = scanner.policy_.patterns_;
  if (auto r = add(scanner.dangerous_, patterns.dangerous_); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = add(scanner.dangerous_, patterns.custom_); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = add(scanner.allowed_, patterns.allowed_); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = add(scanner.blocked_commands_, scanner.policy_.terminal_.blocked_patterns_); !r) {
    return std::unexpected(r.error());
  }
  return scanner;
}

auto Scanner::scan_code(std::string_view content, std::string_view language) const -> SecurityCheckResult {
  std::vector<std::string> reasons;
  std::vector<std::string> violated;

  for (auto const& pattern : dangerous_) {
    if (std::regex_search(content.begin(), content.end(), pattern.regex_)) {
      reasons.push_back(fmt::format("Dangerous pattern detected: {}", pattern.source_));
      violated.push_back(pattern.source_);
    }
  }

  // An empty allow list places no restriction on imports.
  if (!allowed_.empty() && contains_import(content, language)) {
    bool any_allowed = std::ranges::any_of(allowed_, [&](CompiledPattern const& pattern) {
      return std::regex_search(content.begin(), content.end(), pattern.regex_);
    });
    if (!any_allowed) {
      reasons.emplace_back(UNSAFE_IMPORT);
    }
  }

  if (reasons.empty()) {
    return SecurityCheckResult::safe("Code passed security scan");
  }
  return SecurityCheckResult::unsafe(core::util::join(reasons, "; "), std::move(violated));
}

auto Scanner::scan_command(std::string_view command_line) const -> SecurityCheckResult {
  auto const& terminal = policy_.terminal_;
  auto        trimmed  = core::util::trim(command_line);

  if (trimmed.empty()) {
    return SecurityCheckResult::unsafe("Empty command");
  }

  if (command_line.size() > static_cast<size_t>(terminal.max_command_length_)) {
    return SecurityCheckResult::unsafe(
        fmt::format("Command too long ({} > {} characters)", command_line.size(), terminal.max_command_length_)
    );
  }

  auto tokens = core::util::split_whitespace(trimmed);
  auto base   = core::util::to_lower(core::util::base_name(tokens.front()));

  auto in_list = [&base](std::vector<std::string> const& list) {
    return std::ranges::any_of(list, [&base](std::string const& entry) {
      return core::util::to_lower(entry) == base;
    });
  };

  // Dangerous takes precedence over allowed.
  if (in_list(terminal.dangerous_commands_)) {
    switch (policy_.level_) {
      case SecurityLevel::Strict:
      case SecurityLevel::Custom:
        return SecurityCheckResult::unsafe(fmt::format("Dangerous command '{}' blocked", base), {base});
      case SecurityLevel::Moderate:
        if (is_privileged_command(base)) {
          return SecurityCheckResult::unsafe(fmt::format("Privilege escalation command '{}' blocked", base), {base});
        }
        break;
      case SecurityLevel::Permissive: break;
    }
  }

  if (policy_.level_ == SecurityLevel::Strict || terminal.require_whitelist_) {
    if (!in_list(terminal.allowed_commands_)) {
      return SecurityCheckResult::unsafe(fmt::format("Command '{}' not in allowed list", base), {base});
    }
  }

  for (auto const& pattern : blocked_commands_) {
    if (std::regex_search(command_line.begin(), command_line.end(), pattern.regex_)) {
      return SecurityCheckResult::unsafe(
          fmt::format("Blocked command pattern detected: {}", pattern.source_), {pattern.source_}
      );
    }
  }

  return SecurityCheckResult::safe("Command passed security validation");
}

} // namespace xrun::security
