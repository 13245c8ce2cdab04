#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "procex/command.hpp"

namespace fs = std::filesystem;

int main() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path log_path = fs::temp_directory_path() / ("procex_example_append_" + std::to_string(now));

  // Both runs land in the same file, once through a monitored pipe (run) and
  // once attached directly (spawn_and_wait).
  // clang-format off
  const auto cmd = procex::Command{"/usr/bin/printf"}
                       .arg("line\n")
                       .stdout(procex::Redirection::file(log_path,
                                                         procex::OpenMode::write_append,
                                                         0600));
  // clang-format on

  auto first = cmd.run();
  if (!first) {
    std::cerr << "run failed: " << procex::to_string(first.error()) << "\n";
    return 1;
  }
  auto second = cmd.spawn_and_wait();
  if (!second || !second->success()) {
    std::cerr << "spawn_and_wait failed\n";
    return 1;
  }

  std::ifstream log_file(log_path, std::ios::binary);
  std::string contents((std::istreambuf_iterator<char>(log_file)),
                       std::istreambuf_iterator<char>());
  std::error_code remove_ec;
  fs::remove(log_path, remove_ec);

  if (contents != "line\nline\n") {
    std::cerr << "unexpected contents: " << contents << "\n";
    return 1;
  }

  return 0;
}
