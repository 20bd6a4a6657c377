#include <chrono>
#include <expected>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "xrun/config/config.hpp"
#include "xrun/core/log.hpp"

namespace xrun::config {

using json = nlohmann::json;

namespace {

auto read_string(json const& document, char const* key, std::string& target) -> core::Result<void> {
  if (!document.contains(key)) {
    return {};
  }
  if (!document[key].is_string()) {
    return std::unexpected(fmt::format("'{}' must be a string", key));
  }
  target = document[key].get<std::string>();
  return {};
}

auto apply_document(json const& document, Config config) -> core::Result<Config> {
  if (!document.is_object()) {
    return std::unexpected("configuration must be a JSON object");
  }

  std::string text;
  if (auto read = read_string(document, "security_level", text); !read) {
    return std::unexpected(read.error());
  }
  if (!text.empty()) {
    auto level = security::parse_security_level(text);
    if (!level) {
      return std::unexpected(level.error());
    }
    config.security_level_ = *level;
  }

  if (auto read = read_string(document, "execution_mode", config.execution_mode_); !read) {
    return std::unexpected(read.error());
  }

  text.clear();
  if (auto read = read_string(document, "policy_file", text); !read) {
    return std::unexpected(read.error());
  }
  if (!text.empty()) {
    config.policy_file_ = text;
  }

  text.clear();
  if (auto read = read_string(document, "work_dir", text); !read) {
    return std::unexpected(read.error());
  }
  if (!text.empty()) {
    config.work_dir_ = text;
  }

  if (document.contains("compile_timeout")) {
    auto const& value = document["compile_timeout"];
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
      return std::unexpected("'compile_timeout' must be a positive number of seconds");
    }
    config.compile_timeout_ = std::chrono::seconds{value.get<long long>()};
  }

  if (document.contains("container_images")) {
    auto const& images = document["container_images"];
    if (!images.is_object()) {
      return std::unexpected("'container_images' must map language names to images");
    }
    for (auto const& [name, image] : images.items()) {
      auto language = runtime::parse_language(name);
      if (!language) {
        return std::unexpected(language.error());
      }
      if (!image.is_string()) {
        return std::unexpected(fmt::format("container image for '{}' must be a string", name));
      }
      config.container_images_[*language] = image.get<std::string>();
    }
  }

  if (auto read = read_string(document, "docker_binary", config.docker_binary_); !read) {
    return std::unexpected(read.error());
  }
  if (auto read = read_string(document, "curl_binary", config.curl_binary_); !read) {
    return std::unexpected(read.error());
  }

  text.clear();
  if (auto read = read_string(document, "log_level", text); !read) {
    return std::unexpected(read.error());
  }
  if (!text.empty()) {
    config.log_level_ = core::log::parse_level(text);
  }
  return config;
}

} // namespace

auto load_file(std::filesystem::path const& path, Config base) -> core::Result<Config> {
  std::ifstream input(path);
  if (!input) {
    return std::unexpected(fmt::format("cannot open config file '{}'", path.string()));
  }

  json document = json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    return std::unexpected(fmt::format("config file '{}' is not valid JSON", path.string()));
  }

  auto config = apply_document(document, std::move(base));
  if (!config) {
    return std::unexpected(fmt::format("config file '{}': {}", path.string(), config.error()));
  }
  return config;
}

auto apply_environment(Config config, core::env::Environment const& environment) -> Config {
  auto lookup = [&environment](std::string_view name) -> std::string const* {
    auto it = environment.find(std::string(name));
    return it == environment.end() || it->second.empty() ? nullptr : &it->second;
  };

  if (auto const* value = lookup(core::constant::ENV_SECURITY_LEVEL)) {
    if (auto level = security::parse_security_level(*value)) {
      config.security_level_ = *level;
    } else {
      core::log::warn("ignoring {}: {}", core::constant::ENV_SECURITY_LEVEL, level.error());
    }
  }
  if (auto const* value = lookup(core::constant::ENV_EXECUTION_MODE)) {
    config.execution_mode_ = *value;
  }
  if (auto const* value = lookup(core::constant::ENV_POLICY_FILE)) {
    config.policy_file_ = *value;
  }
  if (auto const* value = lookup(core::constant::ENV_WORK_DIR)) {
    config.work_dir_ = *value;
  }
  if (auto const* value = lookup(core::constant::ENV_LOG_LEVEL)) {
    config.log_level_ = core::log::parse_level(*value);
  }
  return config;
}

auto resolve_policy(Config const& config) -> security::SecurityPolicy {
  if (config.policy_file_) {
    return security::load_policy(*config.policy_file_, config.security_level_);
  }
  return security::policy_for_level(config.security_level_);
}

auto factory_options(Config const& config, core::env::Environment environment) -> exec::FactoryOptions {
  exec::FactoryOptions options;
  options.mode_                     = config.execution_mode_;
  options.backend_.work_dir_        = config.work_dir_;
  options.backend_.compile_timeout_ = config.compile_timeout_;
  options.backend_.inherited_env_   = std::move(environment);
  options.container_.binary_        = config.docker_binary_;
  options.container_.images_        = config.container_images_;
  options.curl_binary_              = config.curl_binary_;
  return options;
}

} // namespace xrun::config
