#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <poll.h>
#include <pty.h>
#include <unistd.h>

#include <fmt/core.h>

#include "xrun/core/constant.hpp"
#include "xrun/core/log.hpp"
#include "xrun/process/pty.hpp"

namespace xrun::process {

PseudoTerminal::PseudoTerminal(core::FileDescriptor controller, core::FileDescriptor replica) noexcept
    : controller_(std::move(controller)), replica_(std::move(replica)) {}

auto PseudoTerminal::open() -> core::Result<PseudoTerminal> {
  int controller = -1;
  int replica    = -1;
  if (openpty(&controller, &replica, nullptr, nullptr, nullptr) == -1) {
    return std::unexpected(fmt::format("openpty failed: {}", std::strerror(errno)));
  }

  core::FileDescriptor controller_end{controller};
  core::FileDescriptor replica_end{replica};

  // Neither end may leak into the child beyond the dup2'd standard streams.
  for (auto const* end : {&controller_end, &replica_end}) {
    if (auto configured = end->set_close_on_exec(); !configured) {
      return std::unexpected(fmt::format("cannot configure terminal: {}", std::strerror(configured.error())));
    }
  }
  return PseudoTerminal{std::move(controller_end), std::move(replica_end)};
}

TerminalReader::TerminalReader(core::FileDescriptor controller, std::size_t capacity)
    : controller_(std::move(controller)), capacity_(capacity) {}

TerminalReader::~TerminalReader() {
  stop();
}

auto TerminalReader::start() -> core::Result<void> {
  auto wake = core::open_pipe();
  if (!wake) {
    return std::unexpected(wake.error());
  }
  wake_read_  = std::move(wake->read_);
  wake_write_ = std::move(wake->write_);

  if (auto nb = controller_.set_nonblocking(); !nb) {
    return std::unexpected(fmt::format("cannot make terminal non-blocking: {}", std::strerror(nb.error())));
  }

  try {
    thread_ = std::thread([this] { loop(); });
  } catch (std::system_error const& e) {
    return std::unexpected(fmt::format("cannot start terminal reader: {}", e.what()));
  }
  return {};
}

void TerminalReader::stop() {
  if (thread_.joinable()) {
    if (wake_write_.valid()) {
      [[maybe_unused]] auto woken = wake_write_.write("x");
    }
    thread_.join();
  }
  controller_.reset();
  wake_read_.reset();
  wake_write_.reset();
}

auto TerminalReader::output() const -> std::string {
  std::lock_guard lock(mutex_);
  return buffer_;
}

auto TerminalReader::truncated() const -> bool {
  std::lock_guard lock(mutex_);
  return truncated_;
}

void TerminalReader::append(char const* data, std::size_t size) {
  std::lock_guard lock(mutex_);
  auto room = capacity_ > buffer_.size() ? capacity_ - buffer_.size() : 0;
  if (size > room) {
    truncated_ = true;
  }
  buffer_.append(data, std::min(size, room));
}

void TerminalReader::drain_nonblocking() {
  std::array<char, core::constant::READ_CHUNK_SIZE> chunk{};
  while (true) {
    auto n = controller_.read_some(chunk);
    if (!n) {
      if (n.error() == EINTR) {
        continue;
      }
      return;
    }
    if (*n == 0) {
      return;
    }
    append(chunk.data(), *n);
  }
}

void TerminalReader::loop() {
  std::array<char, core::constant::READ_CHUNK_SIZE> chunk{};
  std::array<pollfd, 2> fds{
      pollfd{controller_.get(), POLLIN, 0},
      pollfd{wake_read_.get(), POLLIN, 0},
  };

  while (true) {
    int ready = poll(fds.data(), fds.size(), -1);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      core::log::warn("terminal reader poll failed: {}", std::strerror(errno));
      break;
    }

    if (fds[1].revents != 0) {
      drain_nonblocking();
      break;
    }

    if ((fds[0].revents & POLLIN) != 0) {
      auto n = controller_.read_some(chunk);
      if (n && *n > 0) {
        append(chunk.data(), *n);
        continue;
      }
      if (!n && (n.error() == EAGAIN || n.error() == EINTR)) {
        continue;
      }
      // EIO: every replica descriptor is closed.
      break;
    }

    if ((fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
      drain_nonblocking();
      break;
    }
  }

  finished_.store(true);
}

} // namespace xrun::process
