#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "procex/destination.hpp"
#include "procex/pipe.hpp"
#include "procex/redirection.hpp"
#include "procex/result.hpp"

namespace procex {

/// @brief OS pipe whose read end is drained by a background thread into a Destination.
///
/// The write end (native_handle()) is handed to a child process as its stdout or
/// stderr. Everything written to it is forwarded, chunk by chunk, to the destination
/// resolved from the redirection value. If the destination fails, the first error is
/// kept and the remaining bytes are dropped; the owner inspects error() after close().
///
/// The owner must call close() once the writing side is finished (normally after the
/// child has exited). close() blocks until the pipe is drained, both ends are closed
/// and the destination has been closed. The destructor calls close() if needed.
class MonitoredPipe {
  struct ConstructionTag {
    explicit ConstructionTag() = default;
  };

 public:
  /// @brief Lifecycle state. Transitions only open -> closing -> closed.
  enum class State : std::uint8_t {
    /// @brief Accepting writes; the monitor thread is forwarding data.
    open,
    /// @brief close() requested or the destination failed; draining.
    closing,
    /// @brief Both pipe ends closed and the monitor thread finished.
    closed,
  };

  /// @brief Default read buffer size.
  static constexpr std::size_t kDefaultChunkSize = 100000;
  /// @brief Bounded wait between reads when no data is available.
  static constexpr std::chrono::milliseconds kPollInterval{1};

  /// @brief Resolve the destination, create the pipe and start the monitor thread.
  ///
  /// Fails with errc::unsupported_redirection for unknown values,
  /// errc::incompatible_destination for spawn-time-only values, and
  /// errc::invalid_argument for a zero chunk size.
  [[nodiscard]] static Result<std::unique_ptr<MonitoredPipe>> create(
      const Redirection& redirection, std::size_t chunk_size = kDefaultChunkSize);
  /// @brief Create and throw on error.
  [[nodiscard]] static std::unique_ptr<MonitoredPipe> create_or_throw(
      const Redirection& redirection, std::size_t chunk_size = kDefaultChunkSize);

  /// @brief Use create(). The tag keeps this constructor private to procex.
  MonitoredPipe(ConstructionTag tag, std::unique_ptr<Destination> destination, PipeReader reader,
                PipeWriter writer, std::size_t chunk_size);
  MonitoredPipe(const MonitoredPipe&) = delete;
  MonitoredPipe& operator=(const MonitoredPipe&) = delete;
  MonitoredPipe(MonitoredPipe&&) = delete;
  MonitoredPipe& operator=(MonitoredPipe&&) = delete;
  /// @brief Close the pipe if still open.
  ~MonitoredPipe();

  /// @brief Write to the pipe's write end. Fails with errc::closed_stream unless open.
  Result<std::size_t> write(std::string_view data);
  /// @brief Drain, close both ends, stop the monitor and close the destination.
  ///
  /// Safe to call more than once; later calls return immediately.
  void close() noexcept;

  /// @brief Write-end descriptor to substitute into the child's stdio, or -1 once closed.
  [[nodiscard]] int native_handle() const;
  /// @brief Current lifecycle state.
  [[nodiscard]] State state() const noexcept { return state_.load(); }
  /// @brief First error raised by the destination, if any.
  [[nodiscard]] std::optional<Error> error() const;
  /// @brief The resolved destination.
  [[nodiscard]] const Destination& destination() const noexcept { return *destination_; }
  /// @brief Read buffer size.
  [[nodiscard]] std::size_t chunk_size() const noexcept { return buffer_.size(); }
  /// @brief True while the monitor thread is still running.
  [[nodiscard]] bool monitoring() const noexcept { return monitoring_.load(); }

  /// @brief Number of pipes created but not yet closed in this process.
  [[nodiscard]] static std::size_t open_instance_count() noexcept;

 private:
  enum class Pump : std::uint8_t { forwarded, idle, eof, failed };

  Result<void> start();
  void monitor() noexcept;
  Pump pump();
  std::optional<Error> forward(std::string_view chunk) noexcept;
  void record_failure(Error error);
  void close_pipe();

  std::unique_ptr<Destination> destination_;
  // Owned by the monitor thread once started.
  PipeReader reader_;
  std::string buffer_;

  mutable std::mutex mutex_;
  std::condition_variable closed_cv_;
  // Written under mutex_; read without it by the monitor loop.
  std::atomic<State> state_{State::open};
  PipeWriter writer_;
  std::optional<Error> error_;

  std::atomic<bool> monitoring_{false};
  std::thread thread_;
  bool destination_closed_ = false;
};

/// @brief Stable name of a pipe state ("open", "closing", "closed").
const char* to_string(MonitoredPipe::State state) noexcept;

}  // namespace procex
