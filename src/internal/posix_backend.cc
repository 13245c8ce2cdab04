#include <dirent.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "procex/internal/backend.hpp"
#include "procex/internal/fd.hpp"
#include "procex/internal/spawn_strategy.hpp"
#include "procex/internal/wait_policy.hpp"
#include "procex/unix.hpp"

extern char** environ;

namespace procex::internal {

namespace {

Error make_errno_error(const char* context) {
  return Error{.code = std::error_code(errno, std::system_category()), .context = context};
}

Error make_spawn_error(int error, const char* context) {
  return Error{.code = std::error_code(error, std::system_category()), .context = context};
}

constexpr long kFallbackMaxFd = 256;
constexpr int kExecFailureExitCode = 127;
constexpr std::array<int, 3> kStdioTargets = {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO};

std::vector<int> list_open_fds() {
  std::vector<int> fds;
#if PROCEX_PLATFORM_LINUX
  if (DIR* dir = ::opendir("/proc/self/fd")) {
    int dir_fd = ::dirfd(dir);
    while (dirent* entry = ::readdir(dir)) {
      if (entry->d_name[0] == '.') {
        continue;
      }
      char* end = nullptr;
      long value = std::strtol(entry->d_name, &end, 10);
      if (!end || *end != '\0') {
        continue;
      }
      int fd = static_cast<int>(value);
      if (fd == dir_fd) {
        continue;
      }
      fds.push_back(fd);
    }
    ::closedir(dir);
    std::ranges::sort(fds);
    return fds;
  }
#endif
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = kFallbackMaxFd;
  }
  for (int fd = 0; fd < max_fd; ++fd) {
    errno = 0;
    if (::fcntl(fd, F_GETFD) != -1 || errno != EBADF) {
      fds.push_back(fd);
    }
  }
  std::ranges::sort(fds);
  return fds;
}

Result<void> add_close_actions_for_inherited_fds(posix_spawn_file_actions_t* actions,
                                                 std::unordered_set<int>* closed_fds) {
  auto fds = list_open_fds();
  for (int fd : fds) {
    if (fd <= STDERR_FILENO) {
      continue;
    }
    if (closed_fds->contains(fd)) {
      continue;
    }
    int rc = posix_spawn_file_actions_addclose(actions, fd);
    if (rc != 0) {
      return make_spawn_error(rc, "posix_spawn_file_actions_addclose");
    }
    closed_fds->insert(fd);
  }
  return {};
}

std::optional<std::string> find_env_value(const std::vector<std::string>& envp, const char* key) {
  std::size_t key_len = std::strlen(key);
  for (const auto& entry : envp) {
    if (entry.size() <= key_len) {
      continue;
    }
    if (entry.compare(0, key_len, key) != 0 || entry[key_len] != '=') {
      continue;
    }
    return entry.substr(key_len + 1);
  }
  return std::nullopt;
}

std::filesystem::path resolve_search_dir(std::string_view raw_dir,
                                         const std::optional<std::filesystem::path>& cwd) {
  std::filesystem::path dir =
      raw_dir.empty() ? std::filesystem::path(".") : std::filesystem::path(raw_dir);
  if (cwd && dir.is_relative()) {
    return *cwd / dir;
  }
  return dir;
}

// Resolve argv[0] before fork so the child only needs async-signal-safe syscalls.
std::string resolve_exec_path(const std::string& argv0, const std::vector<std::string>& envp,
                              const std::optional<std::filesystem::path>& cwd) {
  if (argv0.find('/') != std::string::npos) {
    return argv0;
  }
  std::string path_value;
  if (auto env_path = find_env_value(envp, "PATH")) {
    path_value = std::move(*env_path);
  } else {
    path_value = "/usr/bin:/bin";
  }
  if (path_value.empty()) {
    return argv0;
  }
  std::size_t start = 0;
  while (true) {
    std::size_t end = path_value.find(':', start);
    std::size_t len = (end == std::string::npos) ? path_value.size() - start : end - start;
    std::string_view dir =
        (len == 0) ? std::string_view(".") : std::string_view(path_value).substr(start, len);
    std::filesystem::path candidate = resolve_search_dir(dir, cwd) / argv0;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return argv0;
}

long max_open_fd_limit() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    return kFallbackMaxFd;
  }
  return max_fd;
}

// Close all inherited descriptors after dup2 so descriptors opened by other threads between
// pre-fork bookkeeping and fork() do not leak into the exec'ed process.
void close_inherited_fds_after_fork(int keep_fd) {
  long max_fd = max_open_fd_limit();
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd == keep_fd) {
      continue;
    }
    ::close(fd);
  }
}

// Child side of fork/exec: report errno through the error pipe and exit.
[[noreturn]] void fail_in_child(int error_write_fd) {
  int err = errno;
  // Nothing more can be reported if this write fails.
  [[maybe_unused]] ssize_t written = ::write(error_write_fd, &err, sizeof(err));
  _exit(kExecFailureExitCode);
}

void reap_child_after_exec_failure(pid_t pid) {
  if (pid <= 0) {
    return;
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      break;
    }
  }
}

Result<int> open_null(bool read_only) {
  int flags = (read_only ? O_RDONLY : O_WRONLY) | O_CLOEXEC;
  int fd = ::open("/dev/null", flags);
  if (fd == -1) {
    return make_errno_error("open(/dev/null)");
  }
  return fd;
}

Result<int> open_file(const std::filesystem::path& path, OpenMode mode,
                      std::optional<FilePerms> perms) {
  int flags = open_flags_for(mode) | O_CLOEXEC;
  int fd = ::open(path.c_str(), flags, static_cast<int>(perms.value_or(kDefaultFilePerms)));
  if (fd == -1) {
    return make_errno_error("open(file)");
  }
  return fd;
}

Result<ExitStatus> wait_pid(pid_t pid, int options) {
  int status = 0;
  while (true) {
    pid_t rv = ::waitpid(pid, &status, options);
    if (rv == pid) {
      return unix::from_wait_status(status);
    }
    if (rv == 0) {
      return ExitStatus::other(0);
    }
    if (errno == EINTR) {
      continue;
    }
    return make_errno_error("waitpid");
  }
}

Result<void> send_signal(const Spawned& spawned, int signo) {
  int target = spawned.pid;
  if (spawned.new_process_group && spawned.pgid) {
    target = -(*spawned.pgid);
  }
  if (::kill(target, signo) == -1) {
    return make_errno_error("kill");
  }
  return {};
}

const StdioSpec& stdio_for(const SpawnSpec& spec, int target_fd) {
  switch (target_fd) {
    case STDIN_FILENO:
      return spec.stdin_spec;
    case STDOUT_FILENO:
      return spec.stdout_spec;
    default:
      return spec.stderr_spec;
  }
}

StdioSpec& stdio_for(SpawnSpec& spec, int target_fd) {
  return const_cast<StdioSpec&>(stdio_for(static_cast<const SpawnSpec&>(spec), target_fd));
}

// A parent descriptor 0-2 used as a source may be replaced in the child by an earlier
// redirection (stdout to a file, stderr to the parent's stdout). Spawn from a private
// duplicate instead so every source refers to what the parent had.
Result<SpawnSpec> detach_parent_stdio_sources(const SpawnSpec& spec,
                                              std::vector<unique_fd>& duplicates) {
  SpawnSpec copy = spec;
  for (int target : kStdioTargets) {
    auto& stdio = stdio_for(copy, target);
    if (stdio.kind != StdioSpec::Kind::fd || stdio.fd > STDERR_FILENO) {
      continue;
    }
    unique_fd duplicate(::fcntl(stdio.fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1));
    if (!duplicate) {
      return make_errno_error("fcntl(F_DUPFD_CLOEXEC)");
    }
    stdio.fd = duplicate.get();
    duplicates.push_back(std::move(duplicate));
  }
  return copy;
}

struct SpawnActionState {
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  bool actions_ready = false;
  bool attr_ready = false;

  ~SpawnActionState() {
    if (actions_ready) {
      posix_spawn_file_actions_destroy(&actions);
    }
    if (attr_ready) {
      posix_spawnattr_destroy(&attr);
    }
  }
};

Result<void> add_spawn_action(int rc, const char* context) {
  if (rc != 0) {
    return make_spawn_error(rc, context);
  }
  return {};
}

std::vector<char*> to_c_strings(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

Result<Spawned> spawn_posix_spawnp(const SpawnSpec& spec) {
  SpawnActionState state;
  std::unordered_set<int> closed_fds;
  auto init_actions = add_spawn_action(posix_spawn_file_actions_init(&state.actions),
                                       "posix_spawn_file_actions_init");
  if (!init_actions) {
    return init_actions.error();
  }
  state.actions_ready = true;

  auto init_attr = add_spawn_action(posix_spawnattr_init(&state.attr), "posix_spawnattr_init");
  if (!init_attr) {
    return init_attr.error();
  }
  state.attr_ready = true;

  auto add_close = [&](int fd) -> Result<void> {
    if (fd < 0 || closed_fds.contains(fd)) {
      return {};
    }
    auto rc = posix_spawn_file_actions_addclose(&state.actions, fd);
    if (rc != 0) {
      return make_spawn_error(rc, "posix_spawn_file_actions_addclose");
    }
    closed_fds.insert(fd);
    return {};
  };
  auto add_dup = [&](int src_fd, int dst_fd) -> Result<void> {
    return add_spawn_action(posix_spawn_file_actions_adddup2(&state.actions, src_fd, dst_fd),
                            "posix_spawn_file_actions_adddup2");
  };
  auto add_open = [&](int dst_fd, const char* path, int flags, int mode) -> Result<void> {
    return add_spawn_action(
        posix_spawn_file_actions_addopen(&state.actions, dst_fd, path, flags, mode),
        "posix_spawn_file_actions_addopen");
  };

  if (spec.cwd) {
#if PROCEX_HAS_SPAWN_CHDIR
    auto chdir_action =
        add_spawn_action(posix_spawn_file_actions_addchdir_np(&state.actions, spec.cwd->c_str()),
                         "posix_spawn_file_actions_addchdir_np");
    if (!chdir_action) {
      return chdir_action.error();
    }
#else
    return Error{.code = make_error_code(errc::chdir_failed), .context = "posix_spawn_chdir"};
#endif
  }

  short flags = 0;
  if (spec.opts.new_process_group) {
#ifdef POSIX_SPAWN_SETPGROUP
    flags = static_cast<short>(flags | POSIX_SPAWN_SETPGROUP);
    auto set_pgroup =
        add_spawn_action(posix_spawnattr_setpgroup(&state.attr, 0), "posix_spawnattr_setpgroup");
    if (!set_pgroup) {
      return set_pgroup.error();
    }
#else
    return Error{.code = make_error_code(errc::spawn_failed), .context = "posix_spawn_pgroup"};
#endif
  }
#ifdef POSIX_SPAWN_CLOEXEC_DEFAULT
  flags = static_cast<short>(flags | POSIX_SPAWN_CLOEXEC_DEFAULT);
#endif
  if (flags != 0) {
    auto set_flags =
        add_spawn_action(posix_spawnattr_setflags(&state.attr, flags), "posix_spawnattr_setflags");
    if (!set_flags) {
      return set_flags.error();
    }
  }

  auto setup_stdio = [&](const StdioSpec& stdio, int target_fd) -> Result<void> {
    switch (stdio.kind) {
      case StdioSpec::Kind::inherit:
      case StdioSpec::Kind::child:
        return {};
      case StdioSpec::Kind::null: {
        int open_flags = target_fd == STDIN_FILENO ? O_RDONLY : O_WRONLY;
        return add_open(target_fd, "/dev/null", open_flags, 0);
      }
      case StdioSpec::Kind::file: {
        int perms = static_cast<int>(stdio.perms.value_or(kDefaultFilePerms));
        return add_open(target_fd, stdio.path.c_str(), open_flags_for(stdio.mode), perms);
      }
      case StdioSpec::Kind::fd:
        if (stdio.fd == target_fd) {
          return {};
        }
        return add_dup(stdio.fd, target_fd);
      case StdioSpec::Kind::close:
        return add_close(target_fd);
    }
    return Error{.code = make_error_code(errc::invalid_stdio), .context = "stdio"};
  };

  for (int target : kStdioTargets) {
    auto result = setup_stdio(stdio_for(spec, target), target);
    if (!result) {
      return result.error();
    }
  }
  // Aliases refer to the child's descriptors after every other redirection.
  for (int target : kStdioTargets) {
    const auto& stdio = stdio_for(spec, target);
    if (stdio.kind != StdioSpec::Kind::child) {
      continue;
    }
    auto result = add_dup(stdio.fd, target);
    if (!result) {
      return result.error();
    }
  }

#if !defined(POSIX_SPAWN_CLOEXEC_DEFAULT)
  auto close_result = add_close_actions_for_inherited_fds(&state.actions, &closed_fds);
  if (!close_result) {
    return close_result.error();
  }
#endif

  std::vector<std::string> argv_copy = spec.argv;
  std::vector<char*> argv_c = to_c_strings(argv_copy);
  std::vector<std::string> envp_copy = spec.envp;
  std::vector<char*> envp_c = to_c_strings(envp_copy);

  pid_t pid = -1;
  int spawn_rc =
      ::posix_spawnp(&pid, argv_c[0], &state.actions, &state.attr, argv_c.data(), envp_c.data());
  if (spawn_rc != 0) {
    return make_spawn_error(spawn_rc, "posix_spawnp");
  }

  Spawned spawned;
  spawned.pid = pid;
  spawned.new_process_group = spec.opts.new_process_group;
  if (spec.opts.new_process_group) {
    spawned.pgid = pid;
  }
  return spawned;
}

Result<Spawned> spawn_fork_exec(const SpawnSpec& spec) {
  std::vector<unique_fd> opened_fds;
  std::array<int, 3> sources = {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO};

  for (int target : kStdioTargets) {
    const auto& stdio = stdio_for(spec, target);
    switch (stdio.kind) {
      case StdioSpec::Kind::null: {
        auto fd = open_null(target == STDIN_FILENO);
        if (!fd) {
          return fd.error();
        }
        opened_fds.emplace_back(fd.value());
        sources[target] = fd.value();
        break;
      }
      case StdioSpec::Kind::file: {
        auto fd = open_file(stdio.path, stdio.mode, stdio.perms);
        if (!fd) {
          return fd.error();
        }
        opened_fds.emplace_back(fd.value());
        sources[target] = fd.value();
        break;
      }
      case StdioSpec::Kind::fd:
        sources[target] = stdio.fd;
        break;
      case StdioSpec::Kind::inherit:
      case StdioSpec::Kind::close:
      case StdioSpec::Kind::child:
        break;
    }
  }

  // Error pipe communicates child setup/exec failures back to the parent.
  auto error_pipe_result = create_pipe();
  if (!error_pipe_result) {
    return error_pipe_result.error();
  }
  auto [error_read, error_write] = std::move(error_pipe_result.value());

  std::vector<std::string> argv_copy = spec.argv;
  std::vector<char*> argv_c = to_c_strings(argv_copy);
  std::vector<std::string> envp_copy = spec.envp;
  std::vector<char*> envp_c = to_c_strings(envp_copy);

  std::string exec_path = resolve_exec_path(argv_copy.front(), envp_copy, spec.cwd);

  pid_t pid = ::fork();
  if (pid == -1) {
    return make_errno_error("fork");
  }

  if (pid == 0) {
    int error_write_fd = error_write.get();
    ::close(error_read.get());

    if (spec.opts.new_process_group && ::setpgid(0, 0) == -1) {
      fail_in_child(error_write_fd);
    }
    if (spec.cwd && ::chdir(spec.cwd->c_str()) == -1) {
      fail_in_child(error_write_fd);
    }

    for (int target : kStdioTargets) {
      const auto& stdio = stdio_for(spec, target);
      if (stdio.kind == StdioSpec::Kind::close) {
        ::close(target);
        continue;
      }
      if (sources[target] != target && ::dup2(sources[target], target) == -1) {
        fail_in_child(error_write_fd);
      }
    }
    for (int target : kStdioTargets) {
      const auto& stdio = stdio_for(spec, target);
      if (stdio.kind == StdioSpec::Kind::child && ::dup2(stdio.fd, target) == -1) {
        fail_in_child(error_write_fd);
      }
    }

    close_inherited_fds_after_fork(error_write_fd);

    ::execve(exec_path.c_str(), argv_c.data(), envp_c.data());
    fail_in_child(error_write_fd);
  }

  error_write.reset(-1);
  int child_errno = 0;
  ssize_t read_result = -1;
  while (read_result == -1) {
    read_result = ::read(error_read.get(), &child_errno, sizeof(child_errno));
    if (read_result == -1 && errno != EINTR) {
      break;
    }
  }
  if (read_result == -1) {
    return make_errno_error("read");
  }
  if (read_result > 0) {
    reap_child_after_exec_failure(pid);
    return Error{.code = std::error_code(child_errno, std::system_category()),
                 .context = "spawn"};
  }

  Spawned spawned;
  spawned.pid = pid;
  spawned.new_process_group = spec.opts.new_process_group;
  if (spec.opts.new_process_group) {
    spawned.pgid = pid;
  }
  return spawned;
}

class PosixBackend final : public Backend {
 public:
  Result<Spawned> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty()) {
      return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
    }

    std::vector<unique_fd> duplicates;
    auto detached = detach_parent_stdio_sources(spec, duplicates);
    if (!detached) {
      return detached.error();
    }

    auto strategy = select_spawn_strategy(detached.value());
    if (auto blocker = posix_spawn_blocker(detached.value())) {
      spdlog::debug("spawn {}: {} ({})", spec.argv.front(), to_string(strategy), *blocker);
    }
    if (strategy == SpawnStrategy::posix_spawn) {
      return spawn_posix_spawnp(detached.value());
    }
    return spawn_fork_exec(detached.value());
  }

  Result<WaitOutcome> wait(Spawned& spawned, std::optional<std::chrono::milliseconds> timeout,
                           std::chrono::milliseconds kill_grace) override {
    WaitOps ops;
    ops.try_wait = [&]() { return try_wait(spawned); };
    ops.wait_blocking = [&]() { return wait_pid(spawned.pid, 0); };
    ops.terminate = [&]() { return terminate(spawned); };
    ops.kill = [&]() { return kill(spawned); };
    return wait_with_timeout(ops, default_clock(), timeout, kill_grace);
  }

  Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) override {
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(spawned.pid, &status, WNOHANG);
      if (rv == spawned.pid) {
        return std::optional<ExitStatus>(unix::from_wait_status(status));
      }
      if (rv == 0) {
        return std::optional<ExitStatus>();
      }
      if (errno == EINTR) {
        continue;
      }
      return make_errno_error("waitpid");
    }
  }

  Result<void> terminate(Spawned& spawned) override { return send_signal(spawned, SIGTERM); }

  Result<void> kill(Spawned& spawned) override { return send_signal(spawned, SIGKILL); }

  Result<void> signal(Spawned& spawned, int signo) override { return send_signal(spawned, signo); }
};

std::atomic<Backend*> g_backend_override{nullptr};

}  // namespace

ScopedBackendOverride::ScopedBackendOverride(Backend& backend)
    : previous_(g_backend_override.exchange(&backend)) {}

ScopedBackendOverride::~ScopedBackendOverride() { g_backend_override.store(previous_); }

Backend& default_backend() {
  if (auto* override_backend = g_backend_override.load()) {
    return *override_backend;
  }
  static PosixBackend backend;
  return backend;
}

}  // namespace procex::internal
