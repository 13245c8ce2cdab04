#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "procex/command.hpp"

namespace fs = std::filesystem;

namespace {
fs::path unique_path(const char* stem) {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string name = "procex_example_";
  name.append(stem);
  name.push_back('_');
  name.append(std::to_string(static_cast<long long>(now)));
  return fs::temp_directory_path() / name;
}

std::string slurp(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}
}  // namespace

int main() {
  fs::path input_path = unique_path("in");
  fs::path output_path = unique_path("out");
  {
    std::ofstream input_file(input_path, std::ios::binary);
    input_file << "file-data";
  }

  // stderr joins stdout, so both streams end up in the output file.
  // clang-format off
  const auto cmd = procex::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("cat; printf '+err' 1>&2")
                       .stdin(procex::Redirection::file(input_path))
                       .stdout(procex::Redirection::file(output_path))
                       .stderr(procex::Redirection::child(1));
  // clang-format on

  auto result = cmd.spawn_and_wait();
  std::string output = slurp(output_path);
  std::error_code remove_ec;
  fs::remove(input_path, remove_ec);
  fs::remove(output_path, remove_ec);

  if (!result) {
    std::cerr << "spawn_and_wait failed: " << procex::to_string(result.error()) << "\n";
    return 1;
  }
  if (output != "file-data+err") {
    std::cerr << "unexpected output: " << output << "\n";
    return 1;
  }

  return 0;
}
