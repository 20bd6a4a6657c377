#pragma once

#include <expected>
#include <string>

namespace xrun::core {

template<typename T, typename U = std::string>
using Result = std::expected<T, U>;

} // namespace xrun::core
