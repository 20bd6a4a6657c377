#pragma once

#include <map>
#include <string>
#include <vector>

namespace xrun::core::env {

using Environment = std::map<std::string, std::string>;

auto snapshot() -> Environment;

// "KEY=VALUE" strings in the layout execve expects.
auto to_envp(Environment const& environment) -> std::vector<std::string>;

} // namespace xrun::core::env
