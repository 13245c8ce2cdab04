#include <iostream>

#include "procex/command.hpp"

int main() {
  // Null and close are applied when the child is spawned; no pipe is involved.
  // clang-format off
  const auto cmd = procex::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("cat; printf 'out'; printf 'err' 1>&2")
                       .stdin(procex::Redirection::null())
                       .stdout(procex::Redirection::null())
                       .stderr(procex::Redirection::close());
  // clang-format on

  auto result = cmd.spawn_and_wait();
  if (!result) {
    std::cerr << "spawn_and_wait failed: " << procex::to_string(result.error()) << "\n";
    return 1;
  }
  std::cout << result->describe() << "\n";
  return 0;
}
