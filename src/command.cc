#include "procex/command.hpp"

#include <utility>

#include <spdlog/logger.h>

#include "procex/child.hpp"
#include "procex/destination.hpp"
#include "procex/internal/access.hpp"
#include "procex/internal/backend.hpp"
#include "procex/internal/lowering.hpp"
#include "procex/internal/wait_policy.hpp"
#include "procex/writer.hpp"

namespace procex {

namespace {

using internal::CommandAccess;
using internal::StdioOverride;

struct StreamPipe {
  const char* stream;
  std::unique_ptr<MonitoredPipe> pipe;
};

Result<void> validate(const Command& cmd, const RunOptions& options) {
  auto valid = internal::validate_wait_options(options.wait);
  if (!valid) {
    return valid.error();
  }
  if (options.chunk_size == 0) {
    return Error{.code = make_error_code(errc::invalid_argument),
                 .context = "chunk_size must be positive"};
  }
  if (options.merge_output && CommandAccess::stderr_opt(cmd)) {
    return Error{.code = make_error_code(errc::invalid_argument),
                 .context = "cannot merge output and redirect stderr"};
  }
  return {};
}

Result<RunResult> spawn_and_wait_with(const Command& cmd, const StdioOverride* overrides,
                                      const WaitOptions& options) {
  auto lowered = internal::lower_command(cmd, overrides);
  if (!lowered) {
    return lowered.error();
  }

  auto& backend = internal::default_backend();
  auto& clock = internal::default_clock();
  auto started = clock.now();
  auto spawned = backend.spawn(lowered.value());
  if (!spawned) {
    return spawned.error();
  }

  auto outcome = backend.wait(spawned.value(), options.timeout, options.kill_grace);
  if (!outcome) {
    return outcome.error();
  }

  RunResult result;
  result.argv = lowered->argv;
  result.pid = spawned->pid;
  result.status = outcome->status;
  result.timed_out = outcome->timed_out;
  result.timeout = options.timeout;
  result.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(clock.now() - started);
  return result;
}

// Wraps the stream in a MonitoredPipe when its destination allows it.
Result<void> wrap_stream(const char* stream, std::optional<Redirection>& value,
                         std::size_t chunk_size, std::vector<StreamPipe>& pipes) {
  if (!value) {
    return {};
  }
  auto compatible = compatible_with_monitored_pipe(*value);
  if (!compatible) {
    return compatible.error();
  }
  if (!*compatible) {
    return {};
  }
  auto pipe = MonitoredPipe::create(*value, chunk_size);
  if (!pipe) {
    return pipe.error();
  }
  value = Redirection::pipe(**pipe);
  pipes.push_back(StreamPipe{stream, std::move(pipe.value())});
  return {};
}

// Closes every pipe. The first destination failure becomes a process_io error.
std::optional<Error> close_pipes(const Command& cmd, std::vector<StreamPipe>& pipes) {
  for (auto& entry : pipes) {
    entry.pipe->close();
  }
  for (const auto& entry : pipes) {
    if (auto failure = entry.pipe->error()) {
      RunResult described;
      described.argv = CommandAccess::argv(cmd);
      return Error{.code = make_error_code(errc::process_io),
                   .context = "pipe exception for " + described.command_line() + ": " +
                              entry.stream + ": " + to_string(*failure)};
    }
  }
  return std::nullopt;
}

Result<RunResult> execute(const Command& cmd, StdioOverride overrides,
                          const RunOptions& options) {
  if (options.merge_output) {
    overrides.stderr_override = Redirection::child(1);
  }
  if (!overrides.stdout_override) {
    overrides.stdout_override = CommandAccess::stdout_opt(cmd);
  }
  if (!overrides.stderr_override) {
    overrides.stderr_override = CommandAccess::stderr_opt(cmd);
  }

  std::vector<StreamPipe> pipes;
  auto wrapped = wrap_stream("stdout", overrides.stdout_override, options.chunk_size, pipes);
  if (wrapped) {
    wrapped = wrap_stream("stderr", overrides.stderr_override, options.chunk_size, pipes);
  }

  Result<RunResult> result = wrapped ? spawn_and_wait_with(cmd, &overrides, options.wait)
                                     : Result<RunResult>(wrapped.error());

  if (auto pipe_error = close_pipes(cmd, pipes)) {
    return *pipe_error;
  }
  return result;
}

// Logs the outcome and applies raise_errors.
Result<void> finish(const RunResult& result, const RunOptions& options) {
  if (options.logger) {
    options.logger->info("{} exited with status {}", result.command_line(), result.describe());
  }
  if (!options.raise_errors) {
    return {};
  }
  std::string context = result.command_line() + ", status: " + result.describe();
  if (result.timed_out) {
    return Error{.code = make_error_code(errc::timeout), .context = std::move(context)};
  }
  if (result.signaled()) {
    return Error{.code = make_error_code(errc::command_signaled),
                 .context = std::move(context)};
  }
  if (!result.success()) {
    return Error{.code = make_error_code(errc::command_failed), .context = std::move(context)};
  }
  return {};
}

// Keeps the caller's redirection and adds the capture buffer next to it.
Redirection capture_into(const std::optional<Redirection>& existing, StringWriter& buffer) {
  if (!existing) {
    return Redirection::writer(buffer);
  }
  if (const auto* tee = std::get_if<Redirection::Tee>(&existing->value)) {
    std::vector<Redirection> targets = tee->targets;
    targets.push_back(Redirection::writer(buffer));
    return Redirection::tee(std::move(targets));
  }
  return Redirection::tee({*existing, Redirection::writer(buffer)});
}

}  // namespace

Command::Command(std::string program) { argv_.emplace_back(std::move(program)); }

Command& Command::arg(std::string value) {
  argv_.emplace_back(std::move(value));
  return *this;
}

Command& Command::arg(const char* value) {
  argv_.emplace_back(value);
  return *this;
}

Command& Command::arg(std::string_view value) {
  argv_.emplace_back(value);
  return *this;
}

Command& Command::args(std::initializer_list<std::string_view> values) {
  for (auto value : values) {
    argv_.emplace_back(value);
  }
  return *this;
}

Command& Command::args(std::span<const std::string> values) {
  for (const auto& value : values) {
    argv_.emplace_back(value);
  }
  return *this;
}

Command& Command::current_dir(std::filesystem::path path) {
  cwd_ = std::move(path);
  return *this;
}

Command& Command::env(std::string key, std::string value) {
  env_delta_[std::move(key)] = std::move(value);
  return *this;
}

Command& Command::env_remove(std::string_view key) {
  env_delta_[std::string(key)] = std::nullopt;
  return *this;
}

Command& Command::env_clear() {
  inherit_env_ = false;
  return *this;
}

Command& Command::stdin(Redirection value) {
  stdin_ = std::move(value);
  return *this;
}

Command& Command::stdout(Redirection value) {
  stdout_ = std::move(value);
  return *this;
}

Command& Command::stderr(Redirection value) {
  stderr_ = std::move(value);
  return *this;
}

Command& Command::options(SpawnOptions value) {
  opts_ = value;
  return *this;
}

Result<Child> Command::spawn() const {
  auto lowered = internal::lower_command(*this, nullptr);
  if (!lowered) {
    return lowered.error();
  }

  auto& backend = internal::default_backend();
  auto spawned = backend.spawn(lowered.value());
  if (!spawned) {
    return spawned.error();
  }

  return internal::ChildAccess::from_spawned(spawned.value());
}

Result<RunResult> Command::spawn_and_wait(WaitOptions options) const {
  auto valid = internal::validate_wait_options(options);
  if (!valid) {
    return valid.error();
  }
  return spawn_and_wait_with(*this, nullptr, options);
}

Result<RunResult> Command::run(RunOptions options) const {
  auto valid = validate(*this, options);
  if (!valid) {
    return valid.error();
  }
  auto result = execute(*this, StdioOverride{}, options);
  if (!result) {
    return result.error();
  }
  auto finished = finish(result.value(), options);
  if (!finished) {
    return finished.error();
  }
  return result;
}

Result<CaptureResult> Command::run_with_capture(RunOptions options) const {
  auto valid = validate(*this, options);
  if (!valid) {
    return valid.error();
  }

  StringWriter stdout_buffer;
  StringWriter stderr_buffer;
  StdioOverride overrides;
  overrides.stdout_override = capture_into(stdout_, stdout_buffer);
  if (!options.merge_output) {
    overrides.stderr_override = capture_into(stderr_, stderr_buffer);
  }

  auto result = execute(*this, std::move(overrides), options);
  if (!result) {
    return result.error();
  }

  CaptureResult capture;
  capture.result = std::move(result.value());
  capture.stdout_data = stdout_buffer.take();
  capture.stderr_data = stderr_buffer.take();
  if (options.logger) {
    options.logger->debug("stdout:\n{}\nstderr:\n{}", capture.stdout_data, capture.stderr_data);
  }

  auto finished = finish(capture.result, options);
  if (!finished) {
    return finished.error();
  }
  return capture;
}

Child Command::spawn_or_throw() const {
  auto result = spawn();
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

RunResult Command::spawn_and_wait_or_throw(WaitOptions options) const {
  auto result = spawn_and_wait(options);
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

RunResult Command::run_or_throw(RunOptions options) const {
  auto result = run(std::move(options));
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

CaptureResult Command::run_with_capture_or_throw(RunOptions options) const {
  auto result = run_with_capture(std::move(options));
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

}  // namespace procex
