#pragma once

#include <charconv>
#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "xrun/core/result.hpp"

namespace xrun::cli {

template<typename T>
concept ArgType = std::convertible_to<T, std::string> || requires(T t, char const* ptr, char const* end) {
  std::from_chars(ptr, end, t);
};

class Option {
  std::string                name_;
  char                       short_name_ = '\0';
  std::string                description_;
  std::string                metavar_;
  std::optional<std::string> default_value_;

public:
  Option(std::string name, char short_name) noexcept;

  auto desc(std::string desc) noexcept -> Option&;

  // The option takes one value, shown as metavar in the help text.
  auto value(std::string metavar) noexcept -> Option&;
  auto default_value(std::string value) noexcept -> Option&;

  [[nodiscard]] auto takes_value() const noexcept -> bool { return !metavar_.empty(); }

  friend class ArgumentParser;
};

class Arguments {
  std::map<std::string, std::string, std::less<>> values_;

public:
  std::vector<std::string> positional_;

  [[nodiscard]] bool has(std::string_view name) const noexcept;

  template<ArgType T>
  [[nodiscard]] auto get(std::string_view name) const -> std::optional<T> {
    auto it = values_.find(name);
    if (it == values_.end()) {
      return std::nullopt;
    }

    std::string const& str = it->second;

    if constexpr (std::convertible_to<T, std::string>) {
      return str;
    } else {
      T value{};

      auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
      }
      return value;
    }
  }

  friend class ArgumentParser;
};

// getopt-style parsing: clustered short flags, "-t5" and "-t 5", "--name=value"
// and "--name value", and "--" ending the options.
class ArgumentParser {
  std::string         name_;
  std::string         desc_;
  std::vector<Option> options_;

  [[nodiscard]] auto find(std::string_view name) const noexcept -> Option const*;
  [[nodiscard]] auto find(char short_name) const noexcept -> Option const*;

public:
  explicit ArgumentParser(std::string name = "", std::string desc = "") noexcept;

  auto add_argument(std::string name, char short_name = '\0') noexcept -> Option&;
  auto parse(int argc, char const* const* argv) const -> core::Result<Arguments>;

  void print_help() const;

  static void print_version();
};

auto create_default_arg_parser() -> ArgumentParser;

} // namespace xrun::cli
