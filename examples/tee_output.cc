#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "procex/command.hpp"
#include "procex/writer.hpp"

namespace fs = std::filesystem;

int main() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path copy_path =
      fs::temp_directory_path() / ("procex_example_tee_" + std::to_string(now) + ".log");

  // Every line goes to the file, to our buffer and to the capture.
  procex::StringWriter seen;
  // clang-format off
  const auto cmd = procex::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("echo one; echo two")
                       .stdout(procex::Redirection::tee({procex::Redirection::file(copy_path),
                                                         procex::Redirection::writer(seen)}));
  // clang-format on

  auto out = cmd.run_with_capture();
  if (!out) {
    std::cerr << "run_with_capture failed: " << procex::to_string(out.error()) << "\n";
    return 1;
  }

  std::ifstream copy_file(copy_path, std::ios::binary);
  std::string copy((std::istreambuf_iterator<char>(copy_file)), std::istreambuf_iterator<char>());
  std::error_code remove_ec;
  fs::remove(copy_path, remove_ec);

  const std::string expected = "one\ntwo\n";
  if (copy != expected || seen.str() != expected || out->stdout_data != expected) {
    std::cerr << "tee targets disagree\n";
    return 1;
  }

  return 0;
}
