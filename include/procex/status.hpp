#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procex {

/// @brief Portable process exit status.
class ExitStatus {
 public:
  /// @brief The kind of exit status.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process ended due to signal or other non-exit condition.
    other
  };

  /// @brief Construct a normal exit status with an exit code.
  static ExitStatus exited(int code, std::uint32_t native = 0) noexcept;
  /// @brief Construct a non-exited status (signal/other).
  static ExitStatus other(std::uint32_t native = 0) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && code_ == 0; }
  /// @brief Exit code if available.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Native OS status (wait status or exit code).
  [[nodiscard]] std::uint32_t native() const noexcept { return native_; }

 private:
  Kind kind_{Kind::other};
  int code_{0};
  std::uint32_t native_{0};
};

/// @brief Outcome of a finished command.
struct RunResult {
  /// @brief Argument vector that was executed.
  std::vector<std::string> argv;
  /// @brief Process id of the child.
  int pid = -1;
  /// @brief Final exit status.
  ExitStatus status;
  /// @brief True when the child was terminated because it ran past its timeout.
  bool timed_out = false;
  /// @brief Timeout that was in effect, if any.
  std::optional<std::chrono::milliseconds> timeout;
  /// @brief Wall time from spawn to reap.
  std::chrono::nanoseconds elapsed{0};

  /// @brief True if the child exited with code 0 and did not time out.
  [[nodiscard]] bool success() const noexcept { return !timed_out && status.success(); }
  /// @brief True if the child was terminated by a signal.
  [[nodiscard]] bool signaled() const noexcept;
  /// @brief Terminating signal, if the child was signaled.
  [[nodiscard]] std::optional<int> termination_signal() const noexcept;
  /// @brief argv joined for display.
  [[nodiscard]] std::string command_line() const;
  /// @brief Short status description, e.g. "pid 42 exit 1".
  [[nodiscard]] std::string describe() const;
};

/// @brief Result of a command whose output was captured in memory.
struct CaptureResult {
  /// @brief Outcome of the command.
  RunResult result;
  /// @brief Captured stdout data.
  std::string stdout_data;
  /// @brief Captured stderr data (empty when merged into stdout).
  std::string stderr_data;
};

}  // namespace procex
