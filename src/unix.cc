#include "procex/unix.hpp"

#include <sys/wait.h>

#include <csignal>

namespace procex::unix {

std::optional<int> terminating_signal(const procex::ExitStatus& status) noexcept {
  if (status.kind() == procex::ExitStatus::Kind::exited) {
    return std::nullopt;
  }
  int raw = static_cast<int>(status.native());
  if (WIFSIGNALED(raw)) {
    return WTERMSIG(raw);
  }
  return std::nullopt;
}

std::optional<std::string_view> signal_name(int signo) noexcept {
  switch (signo) {
    case SIGHUP:
      return "SIGHUP";
    case SIGINT:
      return "SIGINT";
    case SIGQUIT:
      return "SIGQUIT";
    case SIGILL:
      return "SIGILL";
    case SIGABRT:
      return "SIGABRT";
    case SIGBUS:
      return "SIGBUS";
    case SIGFPE:
      return "SIGFPE";
    case SIGKILL:
      return "SIGKILL";
    case SIGUSR1:
      return "SIGUSR1";
    case SIGSEGV:
      return "SIGSEGV";
    case SIGUSR2:
      return "SIGUSR2";
    case SIGPIPE:
      return "SIGPIPE";
    case SIGALRM:
      return "SIGALRM";
    case SIGTERM:
      return "SIGTERM";
    default:
      return std::nullopt;
  }
}

std::optional<int> raw_wait_status(const procex::ExitStatus& status) noexcept {
  return static_cast<int>(status.native());
}

procex::ExitStatus from_wait_status(int raw) noexcept {
  if (WIFEXITED(raw)) {
    return procex::ExitStatus::exited(WEXITSTATUS(raw), static_cast<std::uint32_t>(raw));
  }
  return procex::ExitStatus::other(static_cast<std::uint32_t>(raw));
}

}  // namespace procex::unix
