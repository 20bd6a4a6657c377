#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "xrun/core/log.hpp"

namespace xrun::core::log {

namespace {

std::atomic<Level> current_level{Level::Warn};

auto level_tag(Level level) noexcept -> std::string_view {
  switch (level) {
    case Level::Debug: return "debug";
    case Level::Info: return "info";
    case Level::Warn: return "warn";
    case Level::Error: return "error";
    case Level::Off: break;
  }
  return "";
}

} // namespace

void set_level(Level level) noexcept {
  current_level.store(level, std::memory_order_relaxed);
}

auto level() noexcept -> Level {
  return current_level.load(std::memory_order_relaxed);
}

auto parse_level(std::string_view name) noexcept -> Level {
  std::string lowered;
  lowered.reserve(name.size());
  for (char c : name) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lowered == "debug" || lowered == "trace") {
    return Level::Debug;
  }
  if (lowered == "info") {
    return Level::Info;
  }
  if (lowered == "error") {
    return Level::Error;
  }
  if (lowered == "off" || lowered == "none" || lowered == "quiet") {
    return Level::Off;
  }
  return Level::Warn;
}

auto enabled(Level level) noexcept -> bool {
  return level != Level::Off && level >= current_level.load(std::memory_order_relaxed);
}

void write(Level level, std::string_view message) {
  auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
  fmt::print(stderr, "[{:%H:%M:%S}] xrun {}: {}\n", now, level_tag(level), message);
}

} // namespace xrun::core::log
