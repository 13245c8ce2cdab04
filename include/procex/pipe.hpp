#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "procex/internal/fd.hpp"
#include "procex/result.hpp"

namespace procex {

/// @brief Read end of an anonymous pipe. Closes on destruction.
class PipeReader {
 public:
  PipeReader() = default;
  /// @brief Take ownership of a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}

  /// @brief Native file descriptor, or -1 once closed.
  [[nodiscard]] int native_handle() const noexcept { return fd_.get(); }
  /// @brief True until close() is called.
  [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(fd_); }
  /// @brief Close the descriptor. Safe to call more than once.
  void close() noexcept { fd_.reset(-1); }

  /// @brief Wait up to `timeout` until data or EOF can be read without blocking.
  [[nodiscard]] Result<bool> wait_readable(std::chrono::milliseconds timeout) const;
  /// @brief Read up to n bytes into data. Returns 0 at EOF.
  [[nodiscard]] Result<std::size_t> read_some(void* data, std::size_t n) const;
  /// @brief Read until EOF.
  [[nodiscard]] Result<std::string> read_all() const;

 private:
  internal::unique_fd fd_;
};

/// @brief Write end of an anonymous pipe. Closes on destruction.
class PipeWriter {
 public:
  PipeWriter() = default;
  /// @brief Take ownership of a native file descriptor.
  explicit PipeWriter(int fd) : fd_(fd) {}

  /// @brief Native file descriptor, or -1 once closed.
  [[nodiscard]] int native_handle() const noexcept { return fd_.get(); }
  /// @brief True until close() is called.
  [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(fd_); }
  /// @brief Close the descriptor. Safe to call more than once.
  void close() noexcept { fd_.reset(-1); }

  /// @brief Write all of data, blocking while the pipe is full.
  [[nodiscard]] Result<std::size_t> write_all(std::string_view data) const;

 private:
  internal::unique_fd fd_;
};

/// @brief Both ends of one pipe.
struct PipePair {
  PipeReader reader;
  PipeWriter writer;
};

/// @brief Create a pipe whose ends are close-on-exec.
[[nodiscard]] Result<PipePair> make_pipe();

}  // namespace procex
