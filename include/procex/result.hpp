#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "procex/internal/expected.hpp"
#include "procex/platform.hpp"

namespace procex {

/// @brief Error codes for procex operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Configuration / API misuse
  /// @brief Command has no argv entries.
  empty_argv,
  /// @brief Option value out of range or conflicting options.
  invalid_argument,
  /// @brief No destination handler accepts the redirection value.
  unsupported_redirection,
  /// @brief Destination cannot be wrapped by a monitored pipe.
  incompatible_destination,
  /// @brief Redirection cannot be applied at spawn time.
  invalid_stdio,
  /// @brief Write attempted on a pipe that is no longer open.
  closed_stream,

  // OS/syscall or API failures
  /// @brief Pipe creation failed.
  pipe_failed,
  /// @brief Process creation failed.
  spawn_failed,
  /// @brief Wait operation failed.
  wait_failed,
  /// @brief Read operation failed.
  read_failed,
  /// @brief Write operation failed.
  write_failed,
  /// @brief File open failed.
  open_failed,
  /// @brief Change-directory failed.
  chdir_failed,
  /// @brief Termination/kill operation failed.
  kill_failed,

  // High-level
  /// @brief Process was killed after exceeding its timeout.
  timeout,
  /// @brief Process exited with a non-zero code.
  command_failed,
  /// @brief Process was terminated by a signal.
  command_signaled,
  /// @brief A monitored pipe destination failed while the process ran.
  process_io,
};

/// @brief Error payload returned by procex APIs.
struct Error {
  /// @brief Error code in the procex category or the system category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief procex error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the procex category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by procex APIs: a value of type T or an Error.
///
/// Converts implicitly from either, and reads like std::expected
/// (has_value(), value(), error(), operator->).
template <typename T>
using Result = expected<T, Error>;

/// @brief Render an error as "context: message".
std::string to_string(const Error& error);

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace procex

namespace std {

/// @brief Enable implicit conversion from procex::errc to std::error_code.
template <>
struct is_error_code_enum<procex::errc> : true_type {};

}  // namespace std
