#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

#include <fmt/core.h>

#include "xrun/core/log.hpp"
#include "xrun/process/workspace.hpp"

namespace xrun::process {

namespace fs = std::filesystem;

Workspace::Workspace(fs::path path) noexcept
    : path_(std::move(path)) {}

auto Workspace::create(std::string_view prefix) -> core::Result<Workspace> {
  std::error_code ec;
  auto            base = fs::temp_directory_path(ec);
  if (ec) {
    base = "/tmp";
  }

  std::string       pattern = (base / fmt::format("{}XXXXXX", prefix)).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  if (mkdtemp(buffer.data()) == nullptr) {
    return std::unexpected(fmt::format("cannot create workspace under {}: {}", base.string(), std::strerror(errno)));
  }
  return Workspace{fs::path{buffer.data()}};
}

Workspace::~Workspace() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    core::log::warn("failed to remove workspace {}: {}", path_.string(), ec.message());
  }
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::exchange(other.path_, fs::path{})) {}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this != &other) {
    if (!path_.empty()) {
      std::error_code ec;
      fs::remove_all(path_, ec);
    }
    path_ = std::exchange(other.path_, fs::path{});
  }
  return *this;
}

auto Workspace::write_file(std::string const& name, std::string_view content) const -> core::Result<fs::path> {
  auto target = path_ / name;
  std::ofstream output(target, std::ios::binary | std::ios::trunc);
  if (!output) {
    return std::unexpected(fmt::format("cannot create {}", target.string()));
  }
  output.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!output) {
    return std::unexpected(fmt::format("cannot write {}", target.string()));
  }
  return target;
}

} // namespace xrun::process
