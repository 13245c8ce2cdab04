#include <iostream>
#include <string>

#include "procex/command.hpp"

int main() {
  // clang-format off
  const auto cmd = procex::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("printf 'out'; printf 'err' 1>&2");
  // clang-format on

  auto out = cmd.run_with_capture();
  if (!out) {
    std::cerr << "run_with_capture failed: " << procex::to_string(out.error()) << "\n";
    return 1;
  }

  const auto& capture = out.value();
  if (capture.stdout_data != "out" || capture.stderr_data != "err") {
    std::cerr << "unexpected output: stdout='" << capture.stdout_data << "' stderr='"
              << capture.stderr_data << "'\n";
    return 1;
  }

  return 0;
}
