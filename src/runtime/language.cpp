#include <algorithm>
#include <array>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "xrun/core/string_utils.hpp"
#include "xrun/runtime/language.hpp"

namespace xrun::runtime {

namespace {

auto make_table() -> std::vector<LanguageConfig> {
  // clang-format off
  return {
    {Language::Python, "Python", ".py", {}, {"python3", "{file}"}, {"python3", "--version"},
     false, 1.0, 1.0, true, "python:3.11-slim"},
    {Language::JavaScript, "JavaScript", ".js", {}, {"node", "{file}"}, {"node", "--version"},
     false, 1.0, 1.0, false, "node:20-slim"},
    {Language::TypeScript, "TypeScript", ".ts", {"tsc", "--outDir", "{dir}", "{file}"}, {"node", "{output}"},
     {"tsc", "--version"}, true, 1.2, 1.0, false, "node:20-slim"},
    {Language::Java, "Java", ".java", {"javac", "-d", "{dir}", "{file}"}, {"java", "-cp", "{dir}", "{class_name}"},
     {"javac", "-version"}, true, 1.5, 2.0, false, "eclipse-temurin:21"},
    {Language::Cpp, "C++", ".cpp", {"g++", "-o", "{output}", "{file}"}, {"{output}"}, {"g++", "--version"},
     true, 1.0, 1.0, true, "gcc:13"},
    {Language::C, "C", ".c", {"gcc", "-o", "{output}", "{file}"}, {"{output}"}, {"gcc", "--version"},
     true, 1.0, 1.0, true, "gcc:13"},
    {Language::Rust, "Rust", ".rs", {"rustc", "-o", "{output}", "{file}"}, {"{output}"}, {"rustc", "--version"},
     true, 2.0, 1.5, true, "rust:1-slim"},
    {Language::Go, "Go", ".go", {}, {"go", "run", "{file}"}, {"go", "version"},
     false, 1.0, 1.0, false, "golang:1.22"},
    {Language::Php, "PHP", ".php", {}, {"php", "{file}"}, {"php", "--version"},
     false, 1.0, 1.0, true, "php:8-cli"},
    {Language::Ruby, "Ruby", ".rb", {}, {"ruby", "{file}"}, {"ruby", "--version"},
     false, 1.0, 1.0, true, "ruby:3-slim"},
    {Language::Perl, "Perl", ".pl", {}, {"perl", "{file}"}, {"perl", "--version"},
     false, 1.0, 1.0, true, "perl:5-slim"},
    {Language::Bash, "Bash", ".sh", {}, {"bash", "{file}"}, {"bash", "--version"},
     false, 1.0, 1.0, true, "bash:5"},
    {Language::PowerShell, "PowerShell", ".ps1", {}, {"pwsh", "-NoProfile", "-File", "{file}"},
     {"pwsh", "-NoProfile", "-Version"}, false, 1.0, 1.0, false, "mcr.microsoft.com/powershell:latest"},
  };
  // clang-format on
}

void replace_all(std::string& text, std::string_view placeholder, std::string_view value) {
  size_t pos = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), value);
    pos += value.size();
  }
}

auto join_path(std::string_view dir, std::string_view name) -> std::string {
  if (dir.empty()) {
    return std::string{name};
  }
  if (dir.back() == '/') {
    return fmt::format("{}{}", dir, name);
  }
  return fmt::format("{}/{}", dir, name);
}

} // namespace

auto all_languages() -> std::vector<Language> const& {
  static std::vector<Language> const languages = [] {
    std::vector<Language> result;
    for (auto const& config : make_table()) {
      result.push_back(config.language_);
    }
    return result;
  }();
  return languages;
}

auto to_string(Language language) noexcept -> std::string_view {
  switch (language) {
    case Language::Python: return "python";
    case Language::JavaScript: return "javascript";
    case Language::TypeScript: return "typescript";
    case Language::Java: return "java";
    case Language::Cpp: return "cpp";
    case Language::C: return "c";
    case Language::Rust: return "rust";
    case Language::Go: return "go";
    case Language::Php: return "php";
    case Language::Ruby: return "ruby";
    case Language::Perl: return "perl";
    case Language::Bash: return "bash";
    case Language::PowerShell: return "powershell";
  }
  return "unknown";
}

auto parse_language(std::string_view name) -> core::Result<Language> {
  static constexpr std::array<std::pair<std::string_view, Language>, 30> ALIASES{{
      {"python", Language::Python},         {"py", Language::Python},           {"python3", Language::Python},
      {"javascript", Language::JavaScript}, {"js", Language::JavaScript},       {"node", Language::JavaScript},
      {"nodejs", Language::JavaScript},     {"typescript", Language::TypeScript}, {"ts", Language::TypeScript},
      {"java", Language::Java},             {"cpp", Language::Cpp},             {"c++", Language::Cpp},
      {"cxx", Language::Cpp},               {"cc", Language::Cpp},              {"c", Language::C},
      {"rust", Language::Rust},             {"rs", Language::Rust},             {"go", Language::Go},
      {"golang", Language::Go},             {"php", Language::Php},             {"ruby", Language::Ruby},
      {"rb", Language::Ruby},               {"perl", Language::Perl},           {"pl", Language::Perl},
      {"bash", Language::Bash},             {"sh", Language::Bash},             {"shell", Language::Bash},
      {"powershell", Language::PowerShell}, {"pwsh", Language::PowerShell},     {"ps1", Language::PowerShell},
  }};

  auto key = core::util::to_lower(core::util::trim(name));
  auto it  = std::ranges::find_if(ALIASES, [&key](auto const& entry) { return entry.first == key; });
  if (it == ALIASES.end()) {
    return std::unexpected(fmt::format("Unsupported language: '{}'", name));
  }
  return it->second;
}

auto config_for(Language language) -> LanguageConfig const& {
  static std::vector<LanguageConfig> const table = make_table();
  auto it = std::ranges::find_if(table, [language](LanguageConfig const& c) { return c.language_ == language; });
  return *it;
}

auto language_for_extension(std::string_view extension) -> core::Result<Language> {
  auto lowered = core::util::to_lower(extension);
  for (auto language : all_languages()) {
    if (config_for(language).extension_ == lowered) {
      return language;
    }
  }
  if (lowered == ".cc" || lowered == ".cxx") {
    return Language::Cpp;
  }
  return std::unexpected(fmt::format("No language uses the '{}' extension", extension));
}

auto java_class_name(std::string_view content) -> std::string {
  static std::regex const public_class{R"(public\s+(?:final\s+|abstract\s+)*class\s+([A-Za-z_$][A-Za-z0-9_$]*))"};
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(content.begin(), content.end(), match, public_class)) {
    return match[1].str();
  }
  return "Main";
}

auto layout_for(LanguageConfig const& config, std::string_view content) -> SourceLayout {
  switch (config.language_) {
    case Language::Java: {
      auto name = java_class_name(content);
      return SourceLayout{name + config.extension_, name + ".class", name};
    }
    case Language::TypeScript: return SourceLayout{"main.ts", "main.js", "main"};
    default: break;
  }
  return SourceLayout{"main" + config.extension_, "main", "main"};
}

auto render(std::vector<std::string> const& command, SourceLayout const& layout, std::string_view dir)
    -> std::vector<std::string> {
  auto file   = join_path(dir, layout.source_name_);
  auto output = join_path(dir, layout.output_name_);

  std::vector<std::string> argv;
  argv.reserve(command.size());
  for (auto token : command) {
    replace_all(token, "{file}", file);
    replace_all(token, "{output}", output);
    replace_all(token, "{class_name}", layout.class_name_);
    replace_all(token, "{dir}", dir.empty() ? std::string_view{"."} : dir);
    argv.push_back(std::move(token));
  }
  return argv;
}

} // namespace xrun::runtime
