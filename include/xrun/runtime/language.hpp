#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xrun/core/result.hpp"

namespace xrun::runtime {

enum struct Language {
  Python,
  JavaScript,
  TypeScript,
  Java,
  Cpp,
  C,
  Rust,
  Go,
  Php,
  Ruby,
  Perl,
  Bash,
  PowerShell,
};

[[nodiscard]] auto all_languages() -> std::vector<Language> const&;
[[nodiscard]] auto to_string(Language language) noexcept -> std::string_view;

// Case-insensitive; accepts common aliases such as "py", "c++" or "golang".
auto parse_language(std::string_view name) -> core::Result<Language>;

// Command templates are argv vectors. Placeholders {file}, {output},
// {class_name} and {dir} are replaced inside each element, so substituted
// values can never split into extra arguments.
struct LanguageConfig {
  Language                 language_;
  std::string              name_;
  std::string              extension_;
  std::vector<std::string> compile_template_;
  std::vector<std::string> run_template_;
  std::vector<std::string> version_check_;
  bool                     requires_compilation_ = false;
  double                   timeout_multiplier_   = 1.0;
  double                   memory_multiplier_    = 1.0;
  // Runtimes that reserve large virtual ranges up front cannot run under RLIMIT_AS.
  bool                     limit_address_space_ = true;
  std::string              container_image_;
};

[[nodiscard]] auto config_for(Language language) -> LanguageConfig const&;

// Language whose source files carry the extension, such as ".rs".
auto language_for_extension(std::string_view extension) -> core::Result<Language>;

// File names a snippet is materialised under inside its working directory.
struct SourceLayout {
  std::string source_name_;
  std::string output_name_;
  std::string class_name_;
};

[[nodiscard]] auto layout_for(LanguageConfig const& config, std::string_view content) -> SourceLayout;

// Public class of a Java snippet; "Main" when none is declared.
[[nodiscard]] auto java_class_name(std::string_view content) -> std::string;

[[nodiscard]] auto render(std::vector<std::string> const& command, SourceLayout const& layout, std::string_view dir)
    -> std::vector<std::string>;

} // namespace xrun::runtime
