#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/fwd.h>

#include "procex/child.hpp"
#include "procex/monitored_pipe.hpp"
#include "procex/redirection.hpp"
#include "procex/result.hpp"
#include "procex/status.hpp"

namespace procex {

namespace internal {
/// @brief Internal access helper for Command.
struct CommandAccess;
}  // namespace internal

/// @brief Options that affect process creation.
struct SpawnOptions {
  /// @brief Create a new process group; timeouts then signal the whole group.
  bool new_process_group = false;
};

/// @brief Options for Command::run and Command::run_with_capture.
struct RunOptions {
  /// @brief Timeout policy.
  WaitOptions wait;
  /// @brief Turn a timed-out, signaled or failed child into an error.
  bool raise_errors = true;
  /// @brief run_with_capture only: send stderr to the child's stdout and capture both together.
  bool merge_output = false;
  /// @brief Read buffer size for the monitored pipes.
  std::size_t chunk_size = MonitoredPipe::kDefaultChunkSize;
  /// @brief Optional logger for the exit status (info) and captured output (debug).
  std::shared_ptr<spdlog::logger> logger;
};

/// @brief Builder for launching a child process.
///
/// stdout and stderr may be redirected anywhere a Redirection can describe. spawn()
/// and spawn_and_wait() apply redirections directly to the child; run() routes every
/// stdout/stderr redirection that a MonitoredPipe can wrap through one.
class Command {
 public:
  /// @brief Construct a command with argv[0]=program.
  explicit Command(std::string program);

  /// @brief Append a single argument (owned string).
  Command& arg(std::string value);
  /// @brief Append a single argument from a C string.
  Command& arg(const char* value);
  /// @brief Append a single argument from a string view.
  Command& arg(std::string_view value);
  /// @brief Append multiple arguments from an initializer list.
  Command& args(std::initializer_list<std::string_view> values);
  /// @brief Append multiple arguments from a span.
  Command& args(std::span<const std::string> values);

  /// @brief Set current working directory for the child.
  Command& current_dir(std::filesystem::path path);

  /// @brief Set or override an environment variable.
  Command& env(std::string key, std::string value);
  /// @brief Remove an environment variable.
  Command& env_remove(std::string_view key);
  /// @brief Clear inherited environment.
  Command& env_clear();

  /// @brief Configure stdin (null, close, child, fd or file).
  Command& stdin(Redirection value);
  /// @brief Configure stdout.
  Command& stdout(Redirection value);
  /// @brief Configure stderr.
  Command& stderr(Redirection value);

  /// @brief Set spawn options.
  Command& options(SpawnOptions value);

  /// @brief Spawn without waiting.
  ///
  /// Writers without a descriptor and tees fail with errc::invalid_stdio; use run().
  [[nodiscard]] Result<Child> spawn() const;
  /// @brief Spawn and wait with the timeout policy. Never fails on exit status.
  [[nodiscard]] Result<RunResult> spawn_and_wait(WaitOptions options = {}) const;
  /// @brief Spawn with monitored pipes for stdout/stderr, wait, and check the result.
  [[nodiscard]] Result<RunResult> run(RunOptions options = {}) const;
  /// @brief run() that also captures stdout and stderr in memory.
  [[nodiscard]] Result<CaptureResult> run_with_capture(RunOptions options = {}) const;

  /// @brief Spawn and throw on error.
  [[nodiscard]] Child spawn_or_throw() const;
  /// @brief spawn_and_wait and throw on error.
  [[nodiscard]] RunResult spawn_and_wait_or_throw(WaitOptions options = {}) const;
  /// @brief run and throw on error.
  [[nodiscard]] RunResult run_or_throw(RunOptions options = {}) const;
  /// @brief run_with_capture and throw on error.
  [[nodiscard]] CaptureResult run_with_capture_or_throw(RunOptions options = {}) const;

 private:
  /// @brief Argument vector (argv[0] is the program).
  std::vector<std::string> argv_;
  /// @brief Optional working directory for the child.
  std::optional<std::filesystem::path> cwd_;

  /// @brief Whether to inherit the parent environment.
  bool inherit_env_ = true;
  /// @brief Environment updates (set/unset) to apply to the child.
  std::map<std::string, std::optional<std::string>, std::less<>> env_delta_;

  /// @brief Optional stdin redirection.
  std::optional<Redirection> stdin_;
  /// @brief Optional stdout redirection.
  std::optional<Redirection> stdout_;
  /// @brief Optional stderr redirection.
  std::optional<Redirection> stderr_;
  /// @brief Spawn options for the command.
  SpawnOptions opts_{};

  friend struct internal::CommandAccess;
};

}  // namespace procex
