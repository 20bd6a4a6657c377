#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/exec/container_sandbox.hpp"
#include "xrun/exec/pipeline.hpp"

namespace xrun::exec {

namespace {

constexpr std::string_view MOUNT_POINT = "/workspace";

// docker reports a container killed by SIGKILL, which is what the OOM killer sends.
constexpr int OOM_EXIT_CODE = 137;

// Binds an image to the container runner for the steps of one snippet.
class ImageRunner : public process::ProcessRunner {
  ContainerRunner& containers_;
  std::string      image_;

public:
  ImageRunner(ContainerRunner& containers, std::string image)
      : containers_(containers), image_(std::move(image)) {}

  auto run(process::RunRequest const& request) -> core::Result<process::RunOutcome> override {
    return containers_.run(image_, request);
  }
};

} // namespace

auto container_run_flags(security::SecurityPolicy const& policy, uid_t uid, gid_t gid) -> std::vector<std::string> {
  auto const& resources = policy.resources_;

  // clang-format off
  std::vector<std::string> flags{
    "--network",      policy.network_ == security::NetworkPolicy::Allowed ? "bridge" : "none",
    "--memory",       fmt::format("{}m", resources.memory_limit_mb_),
    "--memory-swap",  fmt::format("{}m", resources.memory_limit_mb_),
    "--cpus",         fmt::format("{:g}", resources.cpu_limit_),
    "--pids-limit",   fmt::format("{}", resources.max_processes_),
    "--security-opt", "no-new-privileges",
    "--user",         fmt::format("{}:{}", uid, gid),
  };
  // clang-format on

  if (policy.level_ == security::SecurityLevel::Permissive) {
    flags.insert(flags.end(), {"--cap-drop", "SYS_ADMIN", "--cap-drop", "SYS_MODULE"});
  } else {
    flags.insert(flags.end(), {"--cap-drop", "ALL"});
  }

  if (policy.level_ == security::SecurityLevel::Strict) {
    flags.insert(flags.end(), {"--read-only", "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m"});
  }
  return flags;
}

ContainerRunner::ContainerRunner(
    std::shared_ptr<process::ProcessRunner> inner,
    std::string                             binary,
    std::vector<std::string>                flags
)
    : inner_(std::move(inner)), binary_(std::move(binary)), flags_(std::move(flags)) {}

auto ContainerRunner::command_for(
    std::string const&         name,
    std::string const&         image,
    process::RunRequest const& request
) const -> std::vector<std::string> {
  std::vector<std::string> argv{
      binary_, "run", "--rm", "--name", name,
      "-v", fmt::format("{}:{}", request.work_dir_.string(), MOUNT_POINT),
      "-w", std::string(MOUNT_POINT),
  };
  argv.insert(argv.end(), flags_.begin(), flags_.end());
  argv.push_back(image);
  argv.insert(argv.end(), request.argv_.begin(), request.argv_.end());
  return argv;
}

auto ContainerRunner::run(std::string const& image, process::RunRequest const& request)
    -> core::Result<process::RunOutcome> {
  auto name = fmt::format("xrun_{}_{}", ::getpid(), ++counter_);

  // The docker client runs on the host with the host environment; the
  // container itself is confined by its own flags.
  process::RunRequest outer = request;
  outer.argv_               = command_for(name, image, request);
  outer.env_.reset();
  outer.limits_ = {};

  {
    std::lock_guard lock(mutex_);
    running_.insert(name);
  }
  auto outcome = inner_->run(outer);
  {
    std::lock_guard lock(mutex_);
    running_.erase(name);
  }

  // Killing the client does not stop the container.
  if (outcome && outcome->timed_out_) {
    kill_container(name);
  }
  return outcome;
}

void ContainerRunner::kill_container(std::string const& name) {
  process::RunRequest request;
  request.argv_    = {binary_, "kill", name};
  request.timeout_ = core::constant::CHECK_TIMEOUT;

  auto killed = inner_->run(request);
  if (!killed) {
    core::log::warn("cannot kill container {}: {}", name, killed.error());
  } else if (!killed->succeeded()) {
    core::log::debug("container {} already gone", name);
  }
}

void ContainerRunner::kill_all() {
  std::vector<std::string> names;
  {
    std::lock_guard lock(mutex_);
    names.assign(running_.begin(), running_.end());
  }
  for (auto const& name : names) {
    kill_container(name);
  }
  inner_->terminate_all();
}

ContainerSandbox::ContainerSandbox(
    security::Scanner                       scanner,
    std::shared_ptr<process::ProcessRunner> runner,
    ContainerSettings                       settings,
    BackendOptions                          options
)
    : scanner_(scanner)
    , runner_(runner)
    , settings_(std::move(settings))
    , options_(std::move(options))
    , containers_(runner_, settings_.binary_, container_run_flags(scanner_.policy(), ::getuid(), ::getgid()))
    , shell_(std::move(scanner), std::move(runner), options_.work_dir_, options_.inherited_env_) {}

auto ContainerSandbox::is_available() -> bool {
  std::lock_guard lock(check_mutex_);
  if (!available_) {
    process::RunRequest request;
    request.argv_    = {settings_.binary_, "version"};
    request.timeout_ = core::constant::CHECK_TIMEOUT;

    auto check = runner_->run(request);
    available_ = check && check->succeeded();
    core::log::debug("container runtime {}", *available_ ? "available" : "unavailable");
  }
  return *available_;
}

auto ContainerSandbox::image_for(runtime::Language language) const -> std::string {
  if (auto it = settings_.images_.find(language); it != settings_.images_.end()) {
    return it->second;
  }
  return runtime::config_for(language).container_image_;
}

auto ContainerSandbox::execute(CodeBlock const& code, Timeout timeout) -> ExecutionResult {
  std::string language{runtime::to_string(code.language_)};

  ExecutionResult result;
  bool            passed = true;
  try {
    if (auto refusal = security_gate(scanner_, code)) {
      passed = false;
      result = std::move(*refusal);
    } else {
      auto const& config  = runtime::config_for(code.language_);
      auto        options = pipeline_options(scanner_.policy(), config, timeout, options_, false);
      options.run_limits_       = {};
      options.compile_limits_   = {};
      options.env_.reset();
      options.command_dir_      = std::string(MOUNT_POINT);
      options.workspace_prefix_ = "xrun_docker_";
      // The client's rusage says nothing about the container; docker enforces memory itself.
      options.monitor_memory_ = false;

      ImageRunner runner(containers_, image_for(code.language_));
      result = run_pipeline(runner, config, code.content_, options);

      if (result.status_ == ExecutionStatus::Failed && result.return_code_ == OOM_EXIT_CODE) {
        result.status_        = ExecutionStatus::MemoryLimit;
        result.error_message_ = fmt::format(
            "Container exceeded the {} MB memory limit", scanner_.policy().resources_.memory_limit_mb_
        );
      }
    }
  } catch (std::exception const& e) {
    result = failed_result(fmt::format("Execution error: {}", e.what()));
  }

  log_.record(std::move(language), code.content_, result, passed);
  return result;
}

auto ContainerSandbox::run_command(std::string const& command, Timeout timeout, bool interactive)
    -> TerminalExecutionResult {
  return shell_.run_command(command, timeout, interactive);
}

void ContainerSandbox::cleanup() {
  containers_.kill_all();
}

auto ContainerSandbox::statistics() const -> ExecutionStatistics {
  return log_.statistics();
}

} // namespace xrun::exec
