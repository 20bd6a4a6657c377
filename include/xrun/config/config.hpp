#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "xrun/core/constant.hpp"
#include "xrun/core/env.hpp"
#include "xrun/core/log.hpp"
#include "xrun/core/result.hpp"
#include "xrun/exec/factory.hpp"
#include "xrun/runtime/language.hpp"
#include "xrun/security/policy.hpp"

namespace xrun::config {

// Session settings. Sources, later wins: defaults, JSON file, environment, command line.
struct Config {
  security::SecurityLevel                  security_level_ = security::SecurityLevel::Moderate;
  std::string                              execution_mode_ = "auto";
  std::optional<std::filesystem::path>     policy_file_;
  std::filesystem::path                    work_dir_;
  std::chrono::seconds                     compile_timeout_ = core::constant::DEFAULT_COMPILE_TIMEOUT;
  std::map<runtime::Language, std::string> container_images_;
  std::string                              docker_binary_ = "docker";
  std::string                              curl_binary_   = "curl";
  core::log::Level                         log_level_     = core::log::Level::Warn;
};

// Keys absent from the file keep their value in base.
auto load_file(std::filesystem::path const& path, Config base) -> core::Result<Config>;

// Unparsable values are reported and ignored.
auto apply_environment(Config base, core::env::Environment const& environment) -> Config;

// The policy file when one is configured, otherwise the preset of the level.
auto resolve_policy(Config const& config) -> security::SecurityPolicy;

auto factory_options(Config const& config, core::env::Environment environment) -> exec::FactoryOptions;

} // namespace xrun::config
