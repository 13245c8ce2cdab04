#include "procex/result.hpp"

#include <stdexcept>

namespace procex {

namespace {

class procex_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "procex"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::empty_argv:
        return "empty argv";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::unsupported_redirection:
        return "unsupported redirection target";
      case errc::incompatible_destination:
        return "destination is not compatible with a monitored pipe";
      case errc::invalid_stdio:
        return "invalid stdio";
      case errc::closed_stream:
        return "closed stream";
      case errc::pipe_failed:
        return "pipe failed";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::read_failed:
        return "read failed";
      case errc::write_failed:
        return "write failed";
      case errc::open_failed:
        return "open failed";
      case errc::chdir_failed:
        return "chdir failed";
      case errc::kill_failed:
        return "kill failed";
      case errc::timeout:
        return "timeout";
      case errc::command_failed:
        return "command failed";
      case errc::command_signaled:
        return "command terminated by signal";
      case errc::process_io:
        return "process i/o error";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static procex_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

std::string to_string(const Error& error) {
  if (error.context.empty()) {
    return error.code.message();
  }
  return error.context + ": " + error.code.message();
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw std::runtime_error(error.context.empty() ? error.code.message() : to_string(error));
}

}  // namespace internal

}  // namespace procex
