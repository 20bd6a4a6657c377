#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "xrun/core/result.hpp"
#include "xrun/core/syscall.hpp"

namespace xrun::core {

// Owning descriptor, closed when it goes away.
class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) noexcept;
  ~FileDescriptor() noexcept;

  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

  void reset() noexcept;

  // Zero bytes means end of file. Errors carry errno.
  auto read_some(std::span<char> buffer) const -> syscall::Result<std::size_t>;
  auto write(std::string_view data) const -> syscall::Result<std::size_t>;

  auto set_nonblocking() const -> syscall::Result<void>;
  auto set_close_on_exec() const -> syscall::Result<void>;
};

struct Pipe {
  FileDescriptor read_;
  FileDescriptor write_;
};

// Both ends are closed on exec; a child keeps only what it dup2s.
auto open_pipe() -> Result<Pipe>;

} // namespace xrun::core
