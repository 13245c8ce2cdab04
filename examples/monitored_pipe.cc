#include <iostream>
#include <string>

#include "procex/command.hpp"
#include "procex/monitored_pipe.hpp"
#include "procex/writer.hpp"

int main() {
  // spawn_and_wait only takes spawn-time redirections, so the writer goes
  // behind an explicit MonitoredPipe.
  procex::StringWriter buffer;
  auto pipe = procex::MonitoredPipe::create(procex::Redirection::writer(buffer));
  if (!pipe) {
    std::cerr << "pipe failed: " << procex::to_string(pipe.error()) << "\n";
    return 1;
  }

  // clang-format off
  const auto cmd = procex::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("echo from-child")
                       .stdout(procex::Redirection::pipe(**pipe));
  // clang-format on

  auto result = cmd.spawn_and_wait();
  (*pipe)->close();
  if (!result) {
    std::cerr << "spawn_and_wait failed: " << procex::to_string(result.error()) << "\n";
    return 1;
  }
  if (auto failure = (*pipe)->error()) {
    std::cerr << "destination failed: " << procex::to_string(*failure) << "\n";
    return 1;
  }
  if (buffer.str() != "from-child\n") {
    std::cerr << "unexpected output: " << buffer.str() << "\n";
    return 1;
  }

  return 0;
}
