#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "xrun/core/file_descriptor.hpp"
#include "xrun/core/result.hpp"

namespace xrun::process {

class PseudoTerminal {
  core::FileDescriptor controller_;
  core::FileDescriptor replica_;

  PseudoTerminal(core::FileDescriptor controller, core::FileDescriptor replica) noexcept;

public:
  static auto open() -> core::Result<PseudoTerminal>;

  [[nodiscard]] auto controller() const noexcept -> int { return controller_.get(); }
  [[nodiscard]] auto replica() const noexcept -> int { return replica_.get(); }

  // The parent drops its replica end once the child owns it, so the
  // controller reports EOF when the child side goes away.
  void close_replica() noexcept { replica_.reset(); }
  auto take_controller() noexcept -> core::FileDescriptor { return std::move(controller_); }
};

// Drains a terminal controller on a background thread into a bounded buffer.
// stop() wakes the thread through a self-pipe, so shutdown never depends on
// the child side closing.
class TerminalReader {
  core::FileDescriptor controller_;
  core::FileDescriptor wake_read_;
  core::FileDescriptor wake_write_;
  std::size_t          capacity_;

  mutable std::mutex mutex_;
  std::string        buffer_;
  bool               truncated_ = false;
  std::atomic<bool>  finished_{false};
  std::thread        thread_;

  void loop();
  void append(char const* data, std::size_t size);
  void drain_nonblocking();

public:
  TerminalReader(core::FileDescriptor controller, std::size_t capacity);
  ~TerminalReader();

  TerminalReader(TerminalReader const&)            = delete;
  TerminalReader& operator=(TerminalReader const&) = delete;

  auto start() -> core::Result<void>;
  void stop();

  [[nodiscard]] auto output() const -> std::string;
  [[nodiscard]] auto truncated() const -> bool;
  [[nodiscard]] auto finished() const noexcept -> bool { return finished_.load(); }
};

} // namespace xrun::process
