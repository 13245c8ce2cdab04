#include <iostream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "procex/command.hpp"
#include "procex/writer.hpp"

int main() {
  auto logger = spdlog::stderr_color_mt("child");
  logger->set_pattern("[%n] [%l] %v");

  procex::RunOptions options;
  options.logger = logger;

  int rc = 0;
  {
    // One log record per line of child output; warnings go out at warn level.
    procex::LogWriter out_log(logger, spdlog::level::info);
    procex::LogWriter err_log(logger, spdlog::level::warn);
    // clang-format off
    const auto cmd = procex::Command{"/bin/sh"}
                         .arg("-c")
                         .arg("echo starting; echo 'disk almost full' 1>&2; echo done")
                         .stdout(procex::Redirection::writer(out_log))
                         .stderr(procex::Redirection::writer(err_log));
    // clang-format on

    auto result = cmd.run(options);
    if (!result) {
      std::cerr << "run failed: " << procex::to_string(result.error()) << "\n";
      rc = 1;
    }
  }

  spdlog::drop("child");
  return rc;
}
