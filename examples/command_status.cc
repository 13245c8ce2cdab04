#include <iostream>

#include "procex/command.hpp"

int main() {
  // clang-format off
  const auto cmd = procex::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("exit 7");
  // clang-format on

  // spawn_and_wait reports the status without judging it.
  auto result = cmd.spawn_and_wait();
  if (!result) {
    std::cerr << "spawn_and_wait failed: " << procex::to_string(result.error()) << "\n";
    return 1;
  }
  if (result->status.code().value_or(-1) != 7) {
    std::cerr << "unexpected status: " << result->describe() << "\n";
    return 1;
  }

  // run turns the same status into an error.
  auto raised = cmd.run();
  if (raised || raised.error().code != procex::make_error_code(procex::errc::command_failed)) {
    std::cerr << "expected command_failed\n";
    return 1;
  }
  std::cout << procex::to_string(raised.error()) << "\n";

  return 0;
}
