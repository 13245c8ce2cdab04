#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "procex/command.hpp"

namespace fs = std::filesystem;

int main() {
  fs::path cwd = fs::temp_directory_path();
  fs::path report = cwd / "procex_example_cwd.txt";

  // The child runs in `cwd`; the file path is opened by the parent.
  // clang-format off
  const auto cmd = procex::Command{"/bin/pwd"}
                       .current_dir(cwd)
                       .stdout(procex::Redirection::file(report));
  // clang-format on

  auto result = cmd.run();
  if (!result) {
    std::cerr << "run failed: " << procex::to_string(result.error()) << "\n";
    return 1;
  }

  std::ifstream report_file(report);
  std::string reported;
  std::getline(report_file, reported);
  std::error_code ec;
  fs::remove(report, ec);

  if (!fs::equivalent(reported, cwd, ec)) {
    std::cerr << "unexpected cwd: " << reported << "\n";
    return 1;
  }

  return 0;
}
