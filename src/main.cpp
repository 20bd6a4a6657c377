#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "xrun/cli/argument_parser.hpp"
#include "xrun/config/config.hpp"
#include "xrun/core/constant.hpp"
#include "xrun/core/env.hpp"
#include "xrun/core/log.hpp"
#include "xrun/exec/engine.hpp"

namespace {

using namespace xrun;

constexpr int EXIT_USAGE   = 2;
constexpr int EXIT_TIMEOUT = 124;
constexpr int EXIT_LIMIT   = 137;

auto read_source(std::filesystem::path const& path) -> core::Result<std::string> {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return std::unexpected(fmt::format("cannot read '{}'", path.string()));
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

auto exit_code_for(exec::ExecutionResult const& result) -> int {
  switch (result.status_) {
    case exec::ExecutionStatus::Completed: return 0;
    case exec::ExecutionStatus::Timeout: return EXIT_TIMEOUT;
    case exec::ExecutionStatus::MemoryLimit: return EXIT_LIMIT;
    default: return result.return_code_ > 0 ? result.return_code_ : 1;
  }
}

auto report(exec::ExecutionResult const& result) -> int {
  fmt::print("{}", result.stdout_);
  std::fflush(stdout);
  fmt::print(stderr, "{}", result.stderr_);
  if (!result.succeeded() && result.error_message_) {
    fmt::print(stderr, "{}: {} [{}]\n", core::constant::EXE_NAME, *result.error_message_, to_string(result.status_));
  }
  core::log::info("finished in {:.3f}s", result.execution_time_sec_);
  return exit_code_for(result);
}

void list_languages(exec::Engine const& engine) {
  auto available = engine.list_available_languages();
  for (auto const& name : engine.list_supported_languages()) {
    bool found = std::find(available.begin(), available.end(), name) != available.end();
    fmt::print("{:<12}{}\n", name, found ? "available" : "not installed");
  }
}

// Applies command-line settings on top of file and environment.
auto apply_arguments(config::Config settings, cli::Arguments const& args) -> core::Result<config::Config> {
  if (auto level = args.get<std::string>("security")) {
    auto parsed = security::parse_security_level(*level);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    settings.security_level_ = *parsed;
  }
  if (auto mode = args.get<std::string>("mode")) {
    settings.execution_mode_ = *mode;
  }
  if (auto policy = args.get<std::string>("policy")) {
    settings.policy_file_ = *policy;
  }
  if (args.has("verbose")) {
    settings.log_level_ = core::log::Level::Debug;
  }
  return settings;
}

} // namespace

int main(int argc, char* argv[]) {
  auto parser = cli::create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    fmt::print(stderr, "Error: {}\n\n", args.error());
    parser.print_help();
    return EXIT_USAGE;
  }
  if (args->has("help")) {
    parser.print_help();
    return 0;
  }
  if (args->has("version")) {
    cli::ArgumentParser::print_version();
    return 0;
  }

  auto environment = core::env::snapshot();

  config::Config settings;
  if (auto path = args->get<std::string>("config")) {
    auto loaded = config::load_file(*path, settings);
    if (!loaded) {
      fmt::print(stderr, "Error: {}\n", loaded.error());
      return EXIT_USAGE;
    }
    settings = *std::move(loaded);
  }
  settings = config::apply_environment(std::move(settings), environment);

  auto resolved = apply_arguments(std::move(settings), *args);
  if (!resolved) {
    fmt::print(stderr, "Error: {}\n", resolved.error());
    return EXIT_USAGE;
  }
  settings = *std::move(resolved);
  core::log::set_level(settings.log_level_);

  if (auto path = args->get<std::string>("init-policy")) {
    if (auto written = security::write_policy_template(*path, settings.security_level_); !written) {
      fmt::print(stderr, "Error: {}\n", written.error());
      return 1;
    }
    fmt::print("Wrote {} policy template to {}\n", security::to_string(settings.security_level_), *path);
    return 0;
  }

  exec::Timeout timeout;
  if (args->has("timeout")) {
    auto seconds = args->get<long long>("timeout");
    if (!seconds || *seconds <= 0) {
      fmt::print(stderr, "Error: timeout must be a positive number of seconds\n");
      return EXIT_USAGE;
    }
    timeout = std::chrono::seconds{*seconds};
  }

  auto engine = exec::Engine::create(config::resolve_policy(settings), config::factory_options(settings, environment));
  if (!engine) {
    fmt::print(stderr, "Error: {}\n", engine.error());
    return 1;
  }

  if (args->has("list-languages")) {
    list_languages(**engine);
    return 0;
  }

  int status = 0;
  if (auto command = args->get<std::string>("command")) {
    status = report((*engine)->run_command(*command, timeout, args->has("interactive")));
  } else {
    std::optional<std::string> path = args->get<std::string>("file");
    if (!path && !args->positional_.empty()) {
      path = args->positional_.front();
    }

    std::string code;
    if (auto snippet = args->get<std::string>("eval")) {
      code = *snippet;
    } else if (path) {
      auto source = read_source(*path);
      if (!source) {
        fmt::print(stderr, "Error: {}\n", source.error());
        return 1;
      }
      code = *std::move(source);
    } else if (args->has("language")) {
      code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
      parser.print_help();
      return EXIT_USAGE;
    }

    std::string language;
    if (auto name = args->get<std::string>("language")) {
      language = *name;
    } else if (path) {
      auto detected = runtime::language_for_extension(std::filesystem::path(*path).extension().string());
      if (!detected) {
        fmt::print(stderr, "Error: {}; pass --language\n", detected.error());
        return EXIT_USAGE;
      }
      language = runtime::to_string(*detected);
    } else {
      fmt::print(stderr, "Error: --language is required with --eval\n");
      return EXIT_USAGE;
    }

    status = report((*engine)->execute(code, language, timeout));
  }

  if (args->has("stats")) {
    fmt::print("{}\n", exec::statistics_to_json((*engine)->statistics()).dump(2));
  }
  return status;
}
