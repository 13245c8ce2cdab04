#include <chrono>
#include <iostream>

#include "procex/command.hpp"

int main() {
  // clang-format off
  const auto cmd = procex::Command{"/bin/sleep"}
                       .arg("5");
  // clang-format on

  procex::RunOptions options;
  options.wait.timeout = std::chrono::milliseconds(50);
  options.wait.kill_grace = std::chrono::milliseconds(50);
  options.raise_errors = false;

  auto result = cmd.run(options);
  if (!result) {
    std::cerr << "run failed: " << procex::to_string(result.error()) << "\n";
    return 1;
  }
  if (!result->timed_out) {
    std::cerr << "expected a timeout, got " << result->describe() << "\n";
    return 1;
  }
  std::cout << result->describe() << "\n";

  options.raise_errors = true;
  auto raised = cmd.run(options);
  if (raised || raised.error().code != procex::make_error_code(procex::errc::timeout)) {
    std::cerr << "expected errc::timeout\n";
    return 1;
  }

  return 0;
}
