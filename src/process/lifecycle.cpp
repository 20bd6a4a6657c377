#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/env.hpp"
#include "xrun/core/file_descriptor.hpp"
#include "xrun/core/log.hpp"
#include "xrun/core/syscall.hpp"
#include "xrun/process/lifecycle.hpp"
#include "xrun/process/pty.hpp"
#include "xrun/process/signals.hpp"

namespace xrun::process {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds DRAIN_WINDOW{250};

// Everything the child needs, prepared before fork so the child only makes
// async-signal-safe calls.
struct ChildSetup {
  std::vector<std::string> argv_storage_;
  std::vector<std::string> env_storage_;
  std::vector<char*>       argv_;
  std::vector<char*>       envp_;
  std::string              work_dir_;
  ProcessLimits            limits_;
  StdioMode                stdio_    = StdioMode::Pipes;
  bool                     has_env_  = false;
  int                      out_fd_   = -1;
  int                      err_fd_   = -1;
  int                      tty_fd_   = -1;
  int                      error_fd_ = -1;
};

auto prepare(RunRequest const& request) -> ChildSetup {
  ChildSetup setup;
  setup.argv_storage_ = request.argv_;
  setup.argv_.reserve(setup.argv_storage_.size() + 1);
  for (auto& arg : setup.argv_storage_) {
    setup.argv_.push_back(arg.data());
  }
  setup.argv_.push_back(nullptr);

  if (request.env_) {
    setup.has_env_     = true;
    setup.env_storage_ = core::env::to_envp(*request.env_);
    setup.envp_.reserve(setup.env_storage_.size() + 1);
    for (auto& entry : setup.env_storage_) {
      setup.envp_.push_back(entry.data());
    }
    setup.envp_.push_back(nullptr);
  }

  setup.work_dir_ = request.work_dir_.string();
  setup.limits_   = request.limits_;
  setup.stdio_    = request.stdio_;
  return setup;
}

void set_limit(core::syscall::ResourceKind resource, std::optional<std::size_t> const& value) noexcept {
  if (!value) {
    return;
  }
  // Best effort: a limit above the inherited hard limit is left as is.
  [[maybe_unused]] auto limited = core::syscall::limit_resource(resource, static_cast<rlim_t>(*value));
}

[[noreturn]] void report_and_exit(int error_fd, int error) noexcept {
  [[maybe_unused]] auto n = write(error_fd, &error, sizeof(error));
  _exit(core::constant::EXIT_EXEC_FAILURE);
}

[[noreturn]] void exec_child(ChildSetup const& setup) noexcept {
  if (setup.stdio_ == StdioMode::Terminal) {
    if (setsid() == -1 || ioctl(setup.tty_fd_, TIOCSCTTY, 0) == -1) {
      report_and_exit(setup.error_fd_, errno);
    }
    if (dup2(setup.tty_fd_, STDIN_FILENO) == -1 || dup2(setup.tty_fd_, STDOUT_FILENO) == -1
        || dup2(setup.tty_fd_, STDERR_FILENO) == -1) {
      report_and_exit(setup.error_fd_, errno);
    }
  } else {
    if (setpgid(0, 0) == -1) {
      report_and_exit(setup.error_fd_, errno);
    }
    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd == -1 || dup2(null_fd, STDIN_FILENO) == -1 || dup2(setup.out_fd_, STDOUT_FILENO) == -1
        || dup2(setup.err_fd_, STDERR_FILENO) == -1) {
      report_and_exit(setup.error_fd_, errno);
    }
  }

  set_limit(RLIMIT_AS, setup.limits_.address_space_bytes_);
  set_limit(RLIMIT_CPU, setup.limits_.cpu_seconds_);
  set_limit(RLIMIT_FSIZE, setup.limits_.file_size_bytes_);
  set_limit(RLIMIT_NPROC, setup.limits_.max_processes_);

  if (!setup.work_dir_.empty() && chdir(setup.work_dir_.c_str()) == -1) {
    report_and_exit(setup.error_fd_, errno);
  }

  if (setup.has_env_) {
    execvpe(setup.argv_[0], setup.argv_.data(), setup.envp_.data());
  } else {
    execvp(setup.argv_[0], setup.argv_.data());
  }
  report_and_exit(setup.error_fd_, errno);
}

// Both streams share one byte budget; anything past it is read and dropped.
class OutputCapture {
  std::size_t budget_;
  bool        truncated_ = false;

public:
  explicit OutputCapture(std::size_t budget) noexcept
      : budget_(budget) {}

  void append(std::string& target, char const* data, std::size_t size) {
    auto kept = std::min(size, budget_);
    target.append(data, kept);
    budget_ -= kept;
    if (kept < size) {
      truncated_ = true;
    }
  }

  [[nodiscard]] auto truncated() const noexcept -> bool { return truncated_; }
};

struct Stream {
  core::FileDescriptor fd_;
  std::string*         target_;
};

// Reads whatever is ready; closes streams that hit EOF.
void pump(std::array<Stream, 2>& streams, OutputCapture& capture, std::chrono::milliseconds wait) {
  std::array<pollfd, 2> fds{};
  std::array<int, 2>    index{};
  nfds_t                count = 0;
  for (int i = 0; i < 2; ++i) {
    if (streams[i].fd_.valid()) {
      fds[count]   = pollfd{streams[i].fd_.get(), POLLIN, 0};
      index[count] = i;
      ++count;
    }
  }

  if (count == 0) {
    std::this_thread::sleep_for(wait);
    return;
  }

  int ready = poll(fds.data(), count, static_cast<int>(wait.count()));
  if (ready <= 0) {
    return;
  }

  std::array<char, core::constant::READ_CHUNK_SIZE> chunk{};
  for (nfds_t i = 0; i < count; ++i) {
    if (fds[i].revents == 0) {
      continue;
    }
    auto& stream = streams[index[i]];
    auto  n      = stream.fd_.read_some(chunk);
    if (n && *n > 0) {
      capture.append(*stream.target_, chunk.data(), *n);
    } else if (!n && (n.error() == EINTR || n.error() == EAGAIN)) {
      continue;
    } else {
      stream.fd_.reset();
    }
  }
}

void drain(std::array<Stream, 2>& streams, OutputCapture& capture) {
  auto deadline = Clock::now() + DRAIN_WINDOW;
  while ((streams[0].fd_.valid() || streams[1].fd_.valid()) && Clock::now() < deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    pump(streams, capture, std::max(remaining, std::chrono::milliseconds{1}));
  }
}

void apply_status(RunOutcome& outcome, core::syscall::WaitInfo const& info) {
  if (WIFEXITED(info.status_)) {
    outcome.exit_code_ = WEXITSTATUS(info.status_);
  } else if (WIFSIGNALED(info.status_)) {
    outcome.signaled_  = true;
    outcome.signal_    = WTERMSIG(info.status_);
    outcome.exit_code_ = 128 + outcome.signal_;
  }
  outcome.max_rss_kb_ = info.usage_.ru_maxrss;
}

// Waits for the leader until the deadline. Returns its status if it exited,
// nothing if the deadline passed first.
auto wait_leader(pid_t pid, Clock::time_point deadline, std::array<Stream, 2>* streams, OutputCapture* capture)
    -> core::Result<std::optional<core::syscall::WaitInfo>> {
  while (true) {
    if (auto waited = core::syscall::wait_for_process(pid, WNOHANG); !waited) {
      return std::unexpected(fmt::format("cannot wait for process {}: {}", pid, std::strerror(waited.error())));
    } else if (waited->pid_ == pid) {
      return *waited;
    }

    auto now = Clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    auto wait = std::min(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now), core::constant::POLL_INTERVAL
    );
    wait = std::max(wait, std::chrono::milliseconds{1});

    if (streams != nullptr) {
      pump(*streams, *capture, wait);
    } else {
      std::this_thread::sleep_for(wait);
    }
  }
}

// After a timeout: escalate, then make sure the leader is reaped.
auto stop_group(pid_t pid, std::chrono::milliseconds grace) -> core::syscall::WaitInfo {
  PosixSignalOps ops{pid};
  auto           escalation = terminate_group(pid, grace, ops);
  core::log::debug(
      "process group {} {}", pid,
      escalation == Escalation::Killed       ? "killed"
      : escalation == Escalation::Terminated ? "terminated"
                                             : "already gone"
  );

  if (ops.reaped()) {
    return *ops.reaped();
  }
  if (auto waited = core::syscall::wait_for_process(pid); waited) {
    return *waited;
  }
  return core::syscall::WaitInfo{pid, 0, {}};
}

} // namespace

ProcessLifecycleManager::~ProcessLifecycleManager() {
  terminate_all();
}

void ProcessLifecycleManager::track(ManagedProcess process) {
  std::lock_guard lock(mutex_);
  active_.insert_or_assign(process.pid_, std::move(process));
}

void ProcessLifecycleManager::untrack(pid_t pid) {
  std::lock_guard lock(mutex_);
  active_.erase(pid);
}

auto ProcessLifecycleManager::active() const -> std::vector<ManagedProcess> {
  std::lock_guard             lock(mutex_);
  std::vector<ManagedProcess> result;
  result.reserve(active_.size());
  for (auto const& [_, process] : active_) {
    result.push_back(process);
  }
  return result;
}

void ProcessLifecycleManager::terminate_all() {
  std::vector<pid_t> groups;
  {
    std::lock_guard lock(mutex_);
    for (auto const& [_, process] : active_) {
      groups.push_back(process.process_group_);
    }
  }

  // The owning run() call reaps its own leader; only signal here.
  PosixSignalOps ops;
  for (auto pgid : groups) {
    terminate_group(pgid, core::constant::TERMINATE_GRACE_PERIOD, ops);
  }
}

auto ProcessLifecycleManager::run(RunRequest const& request) -> core::Result<RunOutcome> {
  if (request.argv_.empty() || request.argv_.front().empty()) {
    return std::unexpected(std::string{"cannot run an empty command"});
  }

  ChildSetup setup = prepare(request);

  auto error_pipe = core::open_pipe();
  if (!error_pipe) {
    return std::unexpected(error_pipe.error());
  }
  auto& error_read  = error_pipe->read_;
  auto& error_write = error_pipe->write_;
  setup.error_fd_   = error_write.get();

  std::optional<PseudoTerminal> terminal;
  core::FileDescriptor          out_read;
  core::FileDescriptor          out_write;
  core::FileDescriptor          err_read;
  core::FileDescriptor          err_write;

  if (request.stdio_ == StdioMode::Terminal) {
    auto opened = PseudoTerminal::open();
    if (!opened) {
      return std::unexpected(opened.error());
    }
    terminal.emplace(std::move(*opened));
    setup.tty_fd_ = terminal->replica();
  } else {
    auto out_pipe = core::open_pipe();
    if (!out_pipe) {
      return std::unexpected(out_pipe.error());
    }
    auto err_pipe = core::open_pipe();
    if (!err_pipe) {
      return std::unexpected(err_pipe.error());
    }
    out_read      = std::move(out_pipe->read_);
    out_write     = std::move(out_pipe->write_);
    err_read      = std::move(err_pipe->read_);
    err_write     = std::move(err_pipe->write_);
    setup.out_fd_ = out_write.get();
    setup.err_fd_ = err_write.get();
  }

  auto start = Clock::now();
  auto pid   = core::syscall::fork_process();
  if (!pid) {
    return std::unexpected(fmt::format("fork failed: {}", std::strerror(pid.error())));
  }
  if (*pid == 0) {
    exec_child(setup);
  }

  pid_t child = *pid;
  if (request.stdio_ == StdioMode::Pipes) {
    // Also done in the child; whichever runs first wins.
    setpgid(child, child);
  }

  error_write.reset();
  out_write.reset();
  err_write.reset();
  if (terminal) {
    terminal->close_replica();
  }

  int     exec_error = 0;
  ssize_t got        = 0;
  do {
    got = read(error_read.get(), &exec_error, sizeof(exec_error));
  } while (got == -1 && errno == EINTR);

  if (got == static_cast<ssize_t>(sizeof(exec_error))) {
    [[maybe_unused]] auto reaped = core::syscall::wait_for_process(child);
    return std::unexpected(
        fmt::format("failed to execute '{}': {}", request.argv_.front(), std::strerror(exec_error))
    );
  }

  track(ManagedProcess{child, child, request.work_dir_, start});
  struct Untrack {
    ProcessLifecycleManager* self_;
    pid_t                    pid_;
    ~Untrack() { self_->untrack(pid_); }
  } untrack_guard{this, child};

  RunOutcome    outcome;
  OutputCapture capture{request.max_output_bytes_};
  auto          deadline = start + request.timeout_;

  if (terminal) {
    TerminalReader reader{terminal->take_controller(), request.max_output_bytes_};
    if (auto started = reader.start(); !started) {
      core::log::warn("{}", started.error());
    }

    auto leader = wait_leader(child, deadline, nullptr, nullptr);
    if (!leader) {
      PosixSignalOps{}.send_group(child, SIGKILL);
      reader.stop();
      return std::unexpected(leader.error());
    }
    if (*leader) {
      PosixSignalOps{}.send_group(child, SIGKILL);
      apply_status(outcome, **leader);
    } else {
      outcome.timed_out_ = true;
      apply_status(outcome, stop_group(child, request.grace_period_));
    }

    reader.stop();
    outcome.stdout_           = reader.output();
    outcome.output_truncated_ = reader.truncated();
  } else {
    std::array<Stream, 2> streams{
        Stream{std::move(out_read), &outcome.stdout_},
        Stream{std::move(err_read), &outcome.stderr_},
    };

    auto leader = wait_leader(child, deadline, &streams, &capture);
    if (!leader) {
      PosixSignalOps{}.send_group(child, SIGKILL);
      return std::unexpected(leader.error());
    }
    if (*leader) {
      // No descendant outlives the call.
      PosixSignalOps{}.send_group(child, SIGKILL);
      apply_status(outcome, **leader);
    } else {
      outcome.timed_out_ = true;
      apply_status(outcome, stop_group(child, request.grace_period_));
    }

    drain(streams, capture);
    outcome.output_truncated_ = capture.truncated();
  }

  outcome.elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
  core::log::debug(
      "'{}' finished: exit={} signal={} timed_out={} elapsed={}ms", request.argv_.front(), outcome.exit_code_,
      outcome.signal_, outcome.timed_out_, outcome.elapsed_.count()
  );
  return outcome;
}

} // namespace xrun::process
