#include <algorithm>
#include <cstdio>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "xrun/cli/argument_parser.hpp"
#include "xrun/core/constant.hpp"

namespace xrun::cli {

bool Arguments::has(std::string_view name) const noexcept {
  return values_.contains(name);
}

Option::Option(std::string name, char short_name) noexcept
    : name_{std::move(name)}, short_name_{short_name} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::value(std::string metavar) noexcept -> Option& {
  metavar_ = std::move(metavar);
  return *this;
}

auto Option::default_value(std::string value) noexcept -> Option& {
  default_value_ = std::move(value);
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, char short_name) noexcept -> Option& {
  return options_.emplace_back(std::move(name), short_name);
}

auto ArgumentParser::find(std::string_view name) const noexcept -> Option const* {
  auto it = std::ranges::find_if(options_, [name](Option const& option) { return option.name_ == name; });
  return it == options_.end() ? nullptr : &*it;
}

auto ArgumentParser::find(char short_name) const noexcept -> Option const* {
  if (short_name == '\0') {
    return nullptr;
  }
  auto it = std::ranges::find_if(options_, [short_name](Option const& option) {
    return option.short_name_ == short_name;
  });
  return it == options_.end() ? nullptr : &*it;
}

auto ArgumentParser::parse(int argc, char const* const* argv) const -> core::Result<Arguments> {
  Arguments result;
  for (auto const& option : options_) {
    if (option.default_value_) {
      result.values_[option.name_] = *option.default_value_;
    }
  }

  int i = 1;
  for (; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (arg == "--") {
      ++i;
      break;
    }

    if (arg.starts_with("--")) {
      auto body  = arg.substr(2);
      auto equal = body.find('=');
      auto name  = body.substr(0, equal);

      auto const* option = find(name);
      if (option == nullptr) {
        return std::unexpected(fmt::format("Unknown option: --{}", name));
      }

      if (!option->takes_value()) {
        if (equal != std::string_view::npos) {
          return std::unexpected(fmt::format("Option --{} takes no value", name));
        }
        result.values_[option->name_] = "true";
      } else if (equal != std::string_view::npos) {
        result.values_[option->name_] = std::string(body.substr(equal + 1));
      } else if (i + 1 < argc) {
        result.values_[option->name_] = argv[++i];
      } else {
        return std::unexpected(fmt::format("Option --{} requires a value", name));
      }
      continue;
    }

    if (arg.size() > 1 && arg.front() == '-') {
      for (std::size_t j = 1; j < arg.size(); ++j) {
        auto const* option = find(arg[j]);
        if (option == nullptr) {
          return std::unexpected(fmt::format("Unknown option: -{}", arg[j]));
        }
        if (!option->takes_value()) {
          result.values_[option->name_] = "true";
          continue;
        }

        // The rest of the cluster is the value, otherwise the next argument is.
        if (j + 1 < arg.size()) {
          result.values_[option->name_] = std::string(arg.substr(j + 1));
        } else if (i + 1 < argc) {
          result.values_[option->name_] = argv[++i];
        } else {
          return std::unexpected(fmt::format("Option -{} requires a value", arg[j]));
        }
        break;
      }
      continue;
    }

    result.positional_.emplace_back(arg);
  }

  for (; i < argc; ++i) {
    result.positional_.emplace_back(argv[i]);
  }
  return result;
}

void ArgumentParser::print_help() const {
  fmt::print("Usage: {} [OPTIONS] [FILE]\n\n", name_);
  if (!desc_.empty()) {
    fmt::print("{}\n\n", desc_);
  }
  if (options_.empty()) {
    return;
  }

  std::vector<std::string> usages;
  std::size_t              width = 0;
  for (auto const& option : options_) {
    auto& usage = usages.emplace_back(option.short_name_ != '\0' ? fmt::format("-{}, ", option.short_name_) : "    ");
    usage += fmt::format("--{}", option.name_);
    if (option.takes_value()) {
      usage += fmt::format(" {}", option.metavar_);
    }
    width = std::max(width, usage.size());
  }

  fmt::print("Options:\n");
  for (std::size_t i = 0; i < options_.size(); ++i) {
    auto const& option = options_[i];
    fmt::print("  {:<{}}  {}", usages[i], width, option.description_);
    if (option.default_value_) {
      fmt::print(" (default: {})", *option.default_value_);
    }
    fmt::print("\n");
  }
}

void ArgumentParser::print_version() {
  fmt::print("{} {} {}\n", core::constant::EXE_NAME, core::constant::EXE_DESC, core::constant::VERSION);
}

auto create_default_arg_parser() -> ArgumentParser {
  ArgumentParser parser(std::string(core::constant::EXE_NAME), std::string(core::constant::EXE_DESC));

  // clang-format off
  parser.add_argument("language", 'l').value("<name>").desc("Language of the snippet (python, cpp, rust, ...)");
  parser.add_argument("file", 'f').value("<path>").desc("Read the snippet from a file; the language defaults to its extension");
  parser.add_argument("eval", 'e').value("<code>").desc("Run the given snippet");
  parser.add_argument("command", 'c').value("<command>").desc("Run a shell command");
  parser.add_argument("interactive", 'i').desc("Run the shell command on a pseudo-terminal");
  parser.add_argument("timeout", 't').value("<seconds>").desc("Timeout in seconds");
  parser.add_argument("mode", 'm').value("<backend>").desc("Backend: auto, sandbox, docker, e2b, daytona, multi or terminal");
  parser.add_argument("security", 's').value("<level>").desc("Security level: strict, moderate, permissive or custom");
  parser.add_argument("policy", 'p').value("<path>").desc("Load the security policy from a JSON file");
  parser.add_argument("config").value("<path>").desc("Load settings from a JSON file");
  parser.add_argument("list-languages").desc("List supported languages and whether they are installed");
  parser.add_argument("stats").desc("Print execution statistics as JSON when done");
  parser.add_argument("init-policy").value("<path>").desc("Write a policy template for the security level and exit");
  parser.add_argument("verbose", 'v').desc("Enable verbose output");
  parser.add_argument("help", 'h').desc("Show help message");
  parser.add_argument("version", 'V').desc("Show version message");
  // clang-format on

  return parser;
}

} // namespace xrun::cli
