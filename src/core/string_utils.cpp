#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "xrun/core/string_utils.hpp"

namespace xrun::core::util {

namespace {

auto is_space(char c) noexcept -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

auto to_lower(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return result;
}

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

auto split_whitespace(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  size_t                   pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && is_space(text[pos])) {
      ++pos;
    }
    size_t start = pos;
    while (pos < text.size() && !is_space(text[pos])) {
      ++pos;
    }
    if (pos > start) {
      tokens.emplace_back(text.substr(start, pos - start));
    }
  }
  return tokens;
}

auto base_name(std::string_view path) -> std::string_view {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  if (auto slash = path.rfind('/'); slash != std::string_view::npos && path.size() > 1) {
    return path.substr(slash + 1);
  }
  return path;
}

auto join(std::vector<std::string> const& parts, std::string_view separator) -> std::string {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      result.append(separator);
    }
    result.append(parts[i]);
  }
  return result;
}

} // namespace xrun::core::util
