#pragma once

#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace xrun::core::log {

enum struct Level {
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

void set_level(Level level) noexcept;
[[nodiscard]] auto level() noexcept -> Level;
[[nodiscard]] auto parse_level(std::string_view name) noexcept -> Level;
[[nodiscard]] auto enabled(Level level) noexcept -> bool;

void write(Level level, std::string_view message);

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Debug)) {
    write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Info)) {
    write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Warn)) {
    write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Error)) {
    write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace xrun::core::log
