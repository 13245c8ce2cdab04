#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "procex/result.hpp"
#include "procex/status.hpp"

namespace procex {

namespace internal {
/// @brief Internal access helper for Child.
struct ChildAccess;
}  // namespace internal

/// @brief Wait configuration for child processes.
struct WaitOptions {
  /// @brief Default grace period before a forced kill.
  static constexpr std::chrono::milliseconds kDefaultKillGrace{200};
  /// @brief Optional timeout for waiting. Must not be negative.
  std::optional<std::chrono::milliseconds> timeout;
  /// @brief Grace period after terminate before kill. Must not be negative.
  std::chrono::milliseconds kill_grace{kDefaultKillGrace};
};

/// @brief Result of a bounded wait.
struct WaitOutcome {
  /// @brief Final exit status of the child.
  ExitStatus status;
  /// @brief True when the timeout expired and the child was terminated.
  bool timed_out = false;
};

/// @brief Running child process handle.
class Child {
 public:
  /// @brief Construct an empty child handle.
  Child() = default;
  /// @brief Move-construct a child handle.
  Child(Child&& other) noexcept;
  /// @brief Move-assign a child handle.
  Child& operator=(Child&& other) noexcept;
  Child(const Child&) = delete;
  Child& operator=(const Child&) = delete;
  /// @brief Destroy the child handle.
  ~Child();

  /// @brief Process identifier (pid on POSIX).
  [[nodiscard]] int id() const noexcept;

  /// @brief Wait for child completion.
  Result<ExitStatus> wait();
  /// @brief Non-blocking wait.
  Result<std::optional<ExitStatus>> try_wait();
  /// @brief Wait with timeout and termination policy.
  ///
  /// When the timeout expires the child (or its process group) gets SIGTERM,
  /// then SIGKILL after kill_grace. The outcome reports whether that happened.
  Result<WaitOutcome> wait_for(WaitOptions options);

  /// @brief Send SIGTERM.
  Result<void> terminate();
  /// @brief Send SIGKILL.
  Result<void> kill();
  /// @brief Send a POSIX signal.
  Result<void> signal(int signo);

 private:
  /// @brief Opaque platform-specific implementation.
  struct Impl;
  /// @brief Owned implementation state.
  std::unique_ptr<Impl> impl_;

  friend struct internal::ChildAccess;
};

}  // namespace procex
