#include <iostream>

#include "procex/command.hpp"
#include "procex/unix.hpp"

int main() {
  // clang-format off
  const auto cmd = procex::Command{"/bin/sleep"}
                       .arg("1");
  // clang-format on

  auto child_result = cmd.spawn();
  if (!child_result) {
    std::cerr << "spawn failed: " << procex::to_string(child_result.error()) << "\n";
    return 1;
  }

  auto try_result = child_result->try_wait();
  if (!try_result) {
    std::cerr << "try_wait failed: " << procex::to_string(try_result.error()) << "\n";
    return 1;
  }

  if (try_result->has_value()) {
    if (!try_result->value().success()) {
      std::cerr << "unexpected non-success status\n";
      return 1;
    }
    return 0;
  }

  // Still running: terminate and reap it.
  auto term_result = child_result->terminate();
  if (!term_result) {
    std::cerr << "terminate failed: " << procex::to_string(term_result.error()) << "\n";
    return 1;
  }

  auto wait_result = child_result->wait();
  if (!wait_result) {
    std::cerr << "wait failed: " << procex::to_string(wait_result.error()) << "\n";
    return 1;
  }
  if (!procex::unix::terminating_signal(*wait_result)) {
    std::cerr << "expected a signaled child\n";
    return 1;
  }

  return 0;
}
