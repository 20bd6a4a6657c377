#include <string_view>

#include <fmt/core.h>

#include "xrun/core/string_utils.hpp"
#include "xrun/exec/backend.hpp"

namespace xrun::exec {

auto to_string(BackendKind kind) noexcept -> std::string_view {
  switch (kind) {
    case BackendKind::Process: return "sandbox";
    case BackendKind::Container: return "docker";
    case BackendKind::CloudA: return "e2b";
    case BackendKind::CloudB: return "daytona";
    case BackendKind::Native: return "multi";
    case BackendKind::Terminal: return "terminal";
  }
  return "sandbox";
}

auto parse_backend_kind(std::string_view mode) -> core::Result<BackendKind> {
  auto name = core::util::to_lower(core::util::trim(mode));
  for (auto kind : {BackendKind::Process, BackendKind::Container, BackendKind::CloudA, BackendKind::CloudB,
                    BackendKind::Native, BackendKind::Terminal}) {
    if (name == to_string(kind)) {
      return kind;
    }
  }
  if (name == "process" || name == "local") {
    return BackendKind::Process;
  }
  if (name == "native" || name == "multi_language") {
    return BackendKind::Native;
  }
  return std::unexpected(fmt::format("Unknown execution mode: '{}'", mode));
}

} // namespace xrun::exec
