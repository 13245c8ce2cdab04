#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "procex/redirection.hpp"
#include "procex/result.hpp"

namespace procex {

/// @brief Concrete destination variants, listed in resolution priority order.
enum class DestinationKind : std::uint8_t {
  /// @brief Null device marker (spawn-time only).
  null_device,
  /// @brief Close-in-child marker (spawn-time only).
  close,
  /// @brief Alias to another descriptor of the child (spawn-time only).
  child_redirection,
  /// @brief Process-wide standard output.
  standard_output,
  /// @brief Process-wide standard error.
  standard_error,
  /// @brief Caller-owned descriptor, reopened for every write.
  file_descriptor,
  /// @brief File opened with explicit mode and permissions.
  file_path_mode_perms,
  /// @brief File opened with explicit mode.
  file_path_mode,
  /// @brief File opened for truncating write.
  file_path,
  /// @brief Fan-out to child destinations.
  tee,
  /// @brief Another monitored pipe.
  monitored_pipe,
  /// @brief Writer backed by a descriptor.
  io,
  /// @brief Writer without a descriptor.
  writer,
};

/// @brief Stable name of a destination kind ("file_path", "tee", ...).
const char* to_string(DestinationKind kind) noexcept;

/// @brief Resolved output strategy for a redirection value.
///
/// A destination owns only what it opened itself (a file opened by path, tee
/// children). Caller-supplied writers, descriptors and pipes are never closed,
/// except that a monitored_pipe destination closes its pipe if it is still open.
class Destination {
 public:
  Destination(const Destination&) = delete;
  Destination& operator=(const Destination&) = delete;
  virtual ~Destination() = default;

  /// @brief Forward data to the underlying sink. Returns bytes accepted.
  virtual Result<std::size_t> write(std::string_view data) = 0;
  /// @brief Release resources this destination acquired. Idempotent.
  virtual void close() noexcept {}
  /// @brief Whether the destination may be wrapped by a MonitoredPipe.
  [[nodiscard]] virtual bool compatible_with_monitored_pipe() const noexcept { return true; }
  /// @brief Which variant was selected by the resolver.
  [[nodiscard]] virtual DestinationKind kind() const noexcept = 0;

  /// @brief The redirection value this destination was built from.
  [[nodiscard]] const Redirection& redirection() const noexcept { return redirection_; }

 protected:
  explicit Destination(Redirection redirection) : redirection_(std::move(redirection)) {}

 private:
  Redirection redirection_;
};

/// @brief Select the destination kind for a value without opening anything.
///
/// Fails with errc::unsupported_redirection when no variant accepts the value.
[[nodiscard]] Result<DestinationKind> resolve_destination_kind(const Redirection& value);

/// @brief Resolve and construct the destination for a value.
///
/// File destinations open their file here, so open errors surface immediately.
[[nodiscard]] Result<std::unique_ptr<Destination>> make_destination(const Redirection& value);

/// @brief Whether the value resolves to a destination that a MonitoredPipe can wrap.
[[nodiscard]] Result<bool> compatible_with_monitored_pipe(const Redirection& value);

}  // namespace procex
