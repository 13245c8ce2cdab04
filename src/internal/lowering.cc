#include "procex/internal/lowering.hpp"

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <type_traits>

#include "procex/monitored_pipe.hpp"
#include "procex/writer.hpp"

#if PROCEX_PLATFORM_MACOS
#include <crt_externs.h>
#endif

namespace procex::internal {

namespace {

char** process_environ() {
#if PROCEX_PLATFORM_MACOS
  char*** envp = _NSGetEnviron();
  return (envp != nullptr) ? *envp : nullptr;
#else
  return ::environ;
#endif
}

enum class StdioTarget : std::uint8_t { stdin, stdout, stderr };

int target_fd(StdioTarget target) {
  switch (target) {
    case StdioTarget::stdin:
      return STDIN_FILENO;
    case StdioTarget::stdout:
      return STDOUT_FILENO;
    case StdioTarget::stderr:
      return STDERR_FILENO;
  }
  return -1;
}

OpenMode default_open_mode(StdioTarget target) {
  return target == StdioTarget::stdin ? OpenMode::read : OpenMode::write_truncate;
}

bool mode_is_readable(OpenMode mode) {
  return mode == OpenMode::read || mode == OpenMode::read_write;
}

bool mode_is_writable(OpenMode mode) {
  return mode == OpenMode::write_truncate || mode == OpenMode::write_append ||
         mode == OpenMode::read_write;
}

Error invalid_stdio(std::string context) {
  return Error{.code = make_error_code(errc::invalid_stdio), .context = std::move(context)};
}

StdioSpec fd_spec(int fd, StdioTarget target) {
  StdioSpec spec;
  if (fd != target_fd(target)) {
    spec.kind = StdioSpec::Kind::fd;
    spec.fd = fd;
  }
  return spec;
}

Result<StdioSpec> resolve_stdio(const std::optional<Redirection>& value, StdioTarget target) {
  StdioSpec spec;
  if (!value) {
    return spec;
  }
  const bool is_input = target == StdioTarget::stdin;

  return std::visit(
      [&](const auto& alt) -> Result<StdioSpec> {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<T, Redirection::Null>) {
          spec.kind = StdioSpec::Kind::null;
          return spec;
        } else if constexpr (std::is_same_v<T, Redirection::Close>) {
          spec.kind = StdioSpec::Kind::close;
          return spec;
        } else if constexpr (std::is_same_v<T, Redirection::Child>) {
          if (alt.fd < STDIN_FILENO || alt.fd > STDERR_FILENO) {
            return invalid_stdio("child fd " + std::to_string(alt.fd));
          }
          if (alt.fd == target_fd(target)) {
            return spec;
          }
          spec.kind = StdioSpec::Kind::child;
          spec.fd = alt.fd;
          return spec;
        } else if constexpr (std::is_same_v<T, Redirection::Stdout>) {
          if (is_input) {
            return invalid_stdio("stdin from stdout");
          }
          return fd_spec(STDOUT_FILENO, target);
        } else if constexpr (std::is_same_v<T, Redirection::Stderr>) {
          if (is_input) {
            return invalid_stdio("stdin from stderr");
          }
          return fd_spec(STDERR_FILENO, target);
        } else if constexpr (std::is_same_v<T, Redirection::Fd>) {
          if (alt.fd < 0) {
            return invalid_stdio("fd");
          }
          return fd_spec(alt.fd, target);
        } else if constexpr (std::is_same_v<T, Redirection::File>) {
          OpenMode mode = alt.mode.value_or(default_open_mode(target));
          if (is_input ? !mode_is_readable(mode) : !mode_is_writable(mode)) {
            return invalid_stdio("file_mode");
          }
          spec.kind = StdioSpec::Kind::file;
          spec.path = alt.path;
          spec.mode = mode;
          spec.perms = alt.perms;
          return spec;
        } else if constexpr (std::is_same_v<T, Redirection::Sink>) {
          if (is_input || alt.writer == nullptr) {
            return invalid_stdio("writer");
          }
          auto handle = alt.writer->native_handle();
          if (!handle) {
            return invalid_stdio("writer without a descriptor needs a monitored pipe");
          }
          return fd_spec(*handle, target);
        } else if constexpr (std::is_same_v<T, Redirection::Pipe>) {
          if (is_input || alt.pipe == nullptr) {
            return invalid_stdio("monitored_pipe");
          }
          int handle = alt.pipe->native_handle();
          if (handle < 0) {
            return Error{.code = make_error_code(errc::closed_stream), .context = "monitored_pipe"};
          }
          return fd_spec(handle, target);
        } else {
          return invalid_stdio("tee needs a monitored pipe");
        }
      },
      value->value);
}

}  // namespace

Result<SpawnSpec> lower_command(const Command& cmd, const StdioOverride* override_stdio) {
  if (CommandAccess::argv(cmd).empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
  }

  SpawnSpec spec;
  spec.argv = CommandAccess::argv(cmd);
  spec.cwd = CommandAccess::cwd(cmd);
  spec.opts = CommandAccess::options(cmd);

  std::map<std::string, std::string, std::less<>> env_map;
  if (CommandAccess::inherit_env(cmd)) {
    for (char** env = process_environ(); env && *env != nullptr; ++env) {
      std::string entry(*env);
      auto pos = entry.find('=');
      if (pos == std::string::npos) {
        continue;
      }
      env_map[entry.substr(0, pos)] = entry.substr(pos + 1);
    }
  }

  for (const auto& [key, value] : CommandAccess::env_delta(cmd)) {
    if (value.has_value()) {
      env_map[key] = value.value();
    } else {
      env_map.erase(key);
    }
  }

  for (const auto& [key, value] : env_map) {
    std::string entry;
    entry.reserve(key.size() + 1 + value.size());
    entry.append(key);
    entry.push_back('=');
    entry.append(value);
    spec.envp.push_back(std::move(entry));
  }

  std::optional<Redirection> stdin_value = CommandAccess::stdin_opt(cmd);
  std::optional<Redirection> stdout_value = CommandAccess::stdout_opt(cmd);
  std::optional<Redirection> stderr_value = CommandAccess::stderr_opt(cmd);
  if (override_stdio != nullptr) {
    if (override_stdio->stdin_override) {
      stdin_value = override_stdio->stdin_override;
    }
    if (override_stdio->stdout_override) {
      stdout_value = override_stdio->stdout_override;
    }
    if (override_stdio->stderr_override) {
      stderr_value = override_stdio->stderr_override;
    }
  }

  auto stdin_spec = resolve_stdio(stdin_value, StdioTarget::stdin);
  if (!stdin_spec) {
    return stdin_spec.error();
  }
  auto stdout_spec = resolve_stdio(stdout_value, StdioTarget::stdout);
  if (!stdout_spec) {
    return stdout_spec.error();
  }
  auto stderr_spec = resolve_stdio(stderr_value, StdioTarget::stderr);
  if (!stderr_spec) {
    return stderr_spec.error();
  }

  spec.stdin_spec = stdin_spec.value();
  spec.stdout_spec = stdout_spec.value();
  spec.stderr_spec = stderr_spec.value();
  return spec;
}

}  // namespace procex::internal
