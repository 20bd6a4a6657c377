#include <cerrno>
#include <cstring>
#include <expected>
#include <span>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include "xrun/core/file_descriptor.hpp"

namespace xrun::core {

FileDescriptor::FileDescriptor(int fd) noexcept
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() noexcept {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

void FileDescriptor::reset() noexcept {
  if (fd_ >= 0) {
    // The descriptor is gone whatever close reports.
    ::close(fd_);
    fd_ = -1;
  }
}

auto FileDescriptor::read_some(std::span<char> buffer) const -> syscall::Result<std::size_t> {
  ssize_t n = ::read(fd_, buffer.data(), buffer.size());
  if (n == -1) {
    return std::unexpected(errno);
  }
  return static_cast<std::size_t>(n);
}

auto FileDescriptor::write(std::string_view data) const -> syscall::Result<std::size_t> {
  ssize_t n = 0;
  do {
    n = ::write(fd_, data.data(), data.size());
  } while (n == -1 && errno == EINTR);

  if (n == -1) {
    return std::unexpected(errno);
  }
  return static_cast<std::size_t>(n);
}

auto FileDescriptor::set_nonblocking() const -> syscall::Result<void> {
  int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags == -1 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto FileDescriptor::set_close_on_exec() const -> syscall::Result<void> {
  int flags = ::fcntl(fd_, F_GETFD, 0);
  if (flags == -1 || ::fcntl(fd_, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto open_pipe() -> Result<Pipe> {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    return std::unexpected(fmt::format("cannot create pipe: {}", std::strerror(errno)));
  }
  return Pipe{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

} // namespace xrun::core
