#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace xrun::core::util {

[[nodiscard]] auto to_lower(std::string_view text) -> std::string;
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;
[[nodiscard]] auto split_whitespace(std::string_view text) -> std::vector<std::string>;
[[nodiscard]] auto base_name(std::string_view path) -> std::string_view;
[[nodiscard]] auto join(std::vector<std::string> const& parts, std::string_view separator) -> std::string;

} // namespace xrun::core::util
