#pragma once

#include <optional>
#include <string_view>

#include "procex/status.hpp"

namespace procex::unix {

/// @brief Extract terminating signal from a POSIX wait status, if present.
std::optional<int> terminating_signal(const procex::ExitStatus& status) noexcept;
/// @brief Access raw POSIX wait status.
std::optional<int> raw_wait_status(const procex::ExitStatus& status) noexcept;
/// @brief Exit status for a raw POSIX wait status (as filled in by waitpid).
procex::ExitStatus from_wait_status(int raw) noexcept;
/// @brief Symbolic name ("SIGTERM") for common signals, empty for the rest.
std::optional<std::string_view> signal_name(int signo) noexcept;

}  // namespace procex::unix
