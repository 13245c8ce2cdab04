#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "procex/result.hpp"

namespace spdlog {
class logger;
}  // namespace spdlog

namespace procex {

/// @brief Byte sink that subprocess output can be forwarded to.
///
/// A Writer is only ever called from one thread at a time: the monitored pipe's
/// background thread while a command runs.
class Writer {
 public:
  Writer() = default;
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  virtual ~Writer() = default;

  /// @brief Accept data. Returns the number of bytes consumed.
  virtual Result<std::size_t> write(std::string_view data) = 0;
  /// @brief Descriptor backing this writer, if any.
  ///
  /// Writers that expose a descriptor can be handed to the child directly by
  /// Command::spawn and resolve to the `io` destination.
  [[nodiscard]] virtual std::optional<int> native_handle() const noexcept { return std::nullopt; }
};

/// @brief In-memory buffer writer.
class StringWriter : public Writer {
 public:
  StringWriter() = default;

  Result<std::size_t> write(std::string_view data) override;

  /// @brief Bytes written so far.
  [[nodiscard]] const std::string& str() const noexcept { return buffer_; }
  /// @brief Move the buffered bytes out, leaving the writer empty.
  std::string take() noexcept;

 private:
  std::string buffer_;
};

/// @brief Writes to a caller-owned file descriptor. Never closes it.
class FdWriter : public Writer {
 public:
  explicit FdWriter(int fd) : fd_(fd) {}

  Result<std::size_t> write(std::string_view data) override;
  [[nodiscard]] std::optional<int> native_handle() const noexcept override { return fd_; }

 private:
  int fd_;
};

/// @brief Writes to a caller-owned std::ostream.
class StreamWriter : public Writer {
 public:
  explicit StreamWriter(std::ostream& stream) : stream_(&stream) {}

  Result<std::size_t> write(std::string_view data) override;

 private:
  std::ostream* stream_;
};

/// @brief Forwards output to an spdlog logger, one record per line.
///
/// Bytes after the last newline are held until the next write or flush().
/// The destructor flushes any pending partial line.
class LogWriter : public Writer {
 public:
  explicit LogWriter(std::shared_ptr<spdlog::logger> logger,
                     spdlog::level::level_enum level = spdlog::level::info);
  ~LogWriter() override;

  Result<std::size_t> write(std::string_view data) override;
  /// @brief Emit the pending partial line, if any.
  void flush();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  spdlog::level::level_enum level_;
  std::string pending_;
};

}  // namespace procex
