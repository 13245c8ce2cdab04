#include "procex/status.hpp"

#include <cstdio>

#include "procex/unix.hpp"

namespace procex {

namespace {

bool needs_quoting(const std::string& arg) {
  return arg.empty() || arg.find_first_of(" \t\n\"'\\") != std::string::npos;
}

}  // namespace

ExitStatus ExitStatus::exited(
    int code, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.code_ = code;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::other(std::uint32_t native) noexcept {
  ExitStatus status;
  status.kind_ = Kind::other;
  status.native_ = native;
  return status;
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return code_;
}

bool RunResult::signaled() const noexcept { return termination_signal().has_value(); }

std::optional<int> RunResult::termination_signal() const noexcept {
  if (status.kind() == ExitStatus::Kind::exited) {
    return std::nullopt;
  }
  return unix::terminating_signal(status);
}

std::string RunResult::command_line() const {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    if (!needs_quoting(arg)) {
      out += arg;
      continue;
    }
    out.push_back('"');
    for (char c : arg) {
      if (c == '"' || c == '\\') {
        out.push_back('\\');
      }
      out.push_back(c);
    }
    out.push_back('"');
  }
  return out;
}

std::string RunResult::describe() const {
  std::string out = "pid " + std::to_string(pid);
  if (auto code = status.code()) {
    out += " exit " + std::to_string(*code);
  } else if (auto signo = termination_signal()) {
    if (auto name = unix::signal_name(*signo)) {
      out += " ";
      out += *name;
      out += " (signal " + std::to_string(*signo) + ")";
    } else {
      out += " signal " + std::to_string(*signo);
    }
  } else {
    out += " status " + std::to_string(status.native());
  }
  if (timed_out && timeout) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3fs",
                  static_cast<double>(timeout->count()) / 1000.0);
    out += ", timed out after ";
    out += buffer;
  } else if (timed_out) {
    out += ", timed out";
  }
  return out;
}

}  // namespace procex
