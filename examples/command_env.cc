#include <iostream>
#include <string>

#include "procex/command.hpp"

int main() {
  // clang-format off
  const auto cmd = procex::Command{"/usr/bin/env"}
                       .env_clear()
                       .env("PROCEX_EXAMPLE_KEEP", "keep")
                       .env("PROCEX_EXAMPLE_DROP", "drop")
                       .env_remove("PROCEX_EXAMPLE_DROP");
  // clang-format on

  auto out = cmd.run_with_capture();
  if (!out) {
    std::cerr << "env capture failed: " << procex::to_string(out.error()) << "\n";
    return 1;
  }

  // Only the variable set after env_clear survives.
  if (out->stdout_data != "PROCEX_EXAMPLE_KEEP=keep\n") {
    std::cerr << "unexpected environment:\n" << out->stdout_data;
    return 1;
  }

  return 0;
}
