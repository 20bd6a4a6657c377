#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "xrun/core/result.hpp"

namespace xrun::process {

// Private temporary directory, removed with everything in it when the owner goes away.
class Workspace {
  std::filesystem::path path_;

  explicit Workspace(std::filesystem::path path) noexcept;

public:
  static auto create(std::string_view prefix) -> core::Result<Workspace>;

  ~Workspace();
  Workspace(Workspace const&)            = delete;
  Workspace& operator=(Workspace const&) = delete;
  Workspace(Workspace&& other) noexcept;
  Workspace& operator=(Workspace&& other) noexcept;

  [[nodiscard]] auto path() const noexcept -> std::filesystem::path const& { return path_; }

  auto write_file(std::string const& name, std::string_view content) const -> core::Result<std::filesystem::path>;
};

} // namespace xrun::process
