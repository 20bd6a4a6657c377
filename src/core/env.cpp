#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "xrun/core/env.hpp"

extern "C" {
  extern char** environ; // NOLINT
}

namespace xrun::core::env {

auto snapshot() -> Environment {
  Environment result;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string_view kv{*entry};
    auto             eq = kv.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    result.emplace(std::string{kv.substr(0, eq)}, std::string{kv.substr(eq + 1)});
  }
  return result;
}

auto to_envp(Environment const& environment) -> std::vector<std::string> {
  std::vector<std::string> result;
  result.reserve(environment.size());
  for (auto const& [key, value] : environment) {
    result.push_back(key + "=" + value);
  }
  return result;
}

} // namespace xrun::core::env
