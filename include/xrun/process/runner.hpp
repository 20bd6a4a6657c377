#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/env.hpp"
#include "xrun/core/result.hpp"

namespace xrun::process {

// Unset fields leave the inherited limit in place.
struct ProcessLimits {
  std::optional<std::size_t> address_space_bytes_;
  std::optional<std::size_t> cpu_seconds_;
  std::optional<std::size_t> file_size_bytes_;
  std::optional<std::size_t> max_processes_;
};

enum struct StdioMode {
  Pipes,
  Terminal,
};

struct RunRequest {
  std::vector<std::string>                argv_;
  std::filesystem::path                   work_dir_;
  std::optional<core::env::Environment>   env_;
  std::chrono::milliseconds               timeout_{std::chrono::seconds{30}};
  std::chrono::milliseconds               grace_period_ = core::constant::TERMINATE_GRACE_PERIOD;
  ProcessLimits                           limits_;
  std::size_t                             max_output_bytes_ = 10 * core::constant::MEGABYTE;
  StdioMode                               stdio_            = StdioMode::Pipes;
};

struct RunOutcome {
  std::string               stdout_;
  std::string               stderr_;
  int                       exit_code_ = -1;
  bool                      signaled_  = false;
  int                       signal_    = 0;
  std::chrono::milliseconds elapsed_{0};
  bool                      timed_out_        = false;
  long                      max_rss_kb_       = 0;
  bool                      output_truncated_ = false;

  [[nodiscard]] auto succeeded() const noexcept -> bool { return !timed_out_ && !signaled_ && exit_code_ == 0; }
};

class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  // Errors are reserved for failures to start the process at all.
  virtual auto run(RunRequest const& request) -> core::Result<RunOutcome> = 0;

  // Stops everything this runner still has in flight.
  virtual void terminate_all() {}
};

} // namespace xrun::process
