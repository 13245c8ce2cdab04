#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>

#include "procex/platform.hpp"
#if PROCEX_PLATFORM_POSIX
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#endif
#if PROCEX_PLATFORM_POSIX && defined(PROCEX_FORCE_FORK)
#include <dlfcn.h>
#endif

#include "procex/child.hpp"
#include "procex/command.hpp"
#include "procex/monitored_pipe.hpp"
#include "procex/standard_streams.hpp"
#include "procex/writer.hpp"
#include "tests/helpers/helper_path.hpp"
#include "tests/helpers/test_writers.hpp"

#if PROCEX_PLATFORM_POSIX && defined(PROCEX_FORCE_FORK)
namespace {

std::atomic<bool> g_capture_fork_result{false};
std::atomic<bool> g_open_extra_fd_before_fork{false};
std::atomic<int> g_last_injected_fd{-1};
std::atomic<pid_t> g_last_fork_child{-1};

using fork_fn = pid_t (*)();
fork_fn g_real_fork = nullptr;

constexpr int kInjectedFdLowerBound = 200;

void resolve_fork_fn() {
  if (!g_real_fork) {
    g_real_fork = reinterpret_cast<fork_fn>(::dlsym(RTLD_NEXT, "fork"));
  }
}

}  // namespace

// Opens a stray descriptor right before forking, so the child has to close
// descriptors it never saw during preparation.
extern "C" pid_t fork() {
  resolve_fork_fn();
  if (!g_real_fork) {
    errno = ENOSYS;
    return -1;
  }

  int injected_fd = -1;
  if (g_open_extra_fd_before_fork.load(std::memory_order_relaxed)) {
    int opened = ::open("/dev/null", O_RDONLY);
    if (opened >= 0) {
      injected_fd = ::fcntl(opened, F_DUPFD, kInjectedFdLowerBound);
      ::close(opened);
    }
  }
  g_last_injected_fd.store(injected_fd, std::memory_order_relaxed);

  pid_t pid = g_real_fork();
  if (pid > 0 && g_capture_fork_result.load(std::memory_order_relaxed)) {
    g_last_fork_child.store(pid, std::memory_order_relaxed);
  }
  if (pid != 0 && injected_fd >= 0) {
    ::close(injected_fd);
  }
  return pid;
}
#endif

namespace procex {

namespace {

std::filesystem::path unique_temp_path(std::string_view stem) {
  static std::atomic<std::uint64_t> counter{0};
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  auto id = counter.fetch_add(1, std::memory_order_relaxed);

  std::string filename = "procex_";
  filename.append(stem.data(), stem.size());
  filename.push_back('_');
  filename.append(std::to_string(::getpid()));
  filename.push_back('_');
  filename.append(std::to_string(static_cast<std::uint64_t>(now)));
  filename.push_back('_');
  filename.append(std::to_string(id));
  filename.append(".txt");

  return std::filesystem::temp_directory_path() / filename;
}

std::string helper_path() {
  auto path = support::helper_path();
  if (path.empty()) {
    ADD_FAILURE() << "helper path not found";
  }
  return path;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void write_file(const std::filesystem::path& path, std::string_view data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

std::vector<int> read_fd_list(const std::filesystem::path& path) {
  std::ifstream file(path);
  std::vector<int> fds;
  int fd = -1;
  while (file >> fd) {
    fds.push_back(fd);
  }
  return fds;
}

class ScopedUmask {
 public:
  explicit ScopedUmask(mode_t mask) : previous_(::umask(mask)) {}
  ~ScopedUmask() { ::umask(previous_); }

 private:
  mode_t previous_;
};

class TempFile {
 public:
  explicit TempFile(std::string_view stem) : path_(unique_temp_path(stem)) {}
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

std::size_t count_open_fds() {
#if PROCEX_PLATFORM_LINUX
  std::size_t count = 0;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
    (void)entry;
    ++count;
  }
  return count;
#else
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = 256;
  }
  std::size_t count = 0;
  for (int fd = 0; fd < max_fd; ++fd) {
    errno = 0;
    if (::fcntl(fd, F_GETFD) != -1 || errno != EBADF) {
      ++count;
    }
  }
  return count;
#endif
}

void close_non_stdio_fds() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = 256;
  }
  for (int fd = 3; fd < max_fd; ++fd) {
    ::close(fd);
  }
}

// The helper's descriptor set when exec'd with nothing but stdio. Sanitizer
// runtimes may add their own.
std::vector<int> baseline_helper_fds(const std::string& helper) {
  TempFile fd_file("baseline_fds");

  pid_t pid = ::fork();
  if (pid == 0) {
    close_non_stdio_fds();
    ::execl(helper.c_str(), helper.c_str(), "--write-open-fds", fd_file.path().c_str(),
            static_cast<char*>(nullptr));
    _exit(127);
  }
  if (pid < 0) {
    ADD_FAILURE() << "fork failed";
    return {};
  }

  int status = 0;
  if (::waitpid(pid, &status, 0) == -1) {
    ADD_FAILURE() << "waitpid failed";
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    ADD_FAILURE() << "baseline helper failed";
  }
  return read_fd_list(fd_file.path());
}

#if PROCEX_HAS_THREAD_SANITIZER
constexpr std::chrono::milliseconds kShortTimeout{1000};
#else
constexpr std::chrono::milliseconds kShortTimeout{200};
#endif

}  // namespace

class CommandIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    helper_ = helper_path();
    ASSERT_FALSE(helper_.empty());
  }

  void TearDown() override { EXPECT_EQ(MonitoredPipe::open_instance_count(), 0u); }

  [[nodiscard]] Command helper(std::initializer_list<std::string_view> args) const {
    Command cmd(helper_);
    cmd.args(args);
    return cmd;
  }

  std::string helper_;
};

TEST_F(CommandIntegrationTest, RunWithCaptureCollectsStdoutAndStderr) {
  auto result = helper({"--stdout-text", "hello", "--stderr-text", "oops"}).run_with_capture();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(result->stdout_data, "hello");
  EXPECT_EQ(result->stderr_data, "oops");
  EXPECT_TRUE(result->result.success());
  EXPECT_GT(result->result.pid, 0);
}

TEST_F(CommandIntegrationTest, MergeOutputKeepsWriteOrder) {
  RunOptions options;
  options.merge_output = true;
  auto result = helper({"--stdout-text", "1", "--stderr-text", "2", "--stdout-text", "3"})
                    .run_with_capture(options);
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(result->stdout_data, "123");
  EXPECT_TRUE(result->stderr_data.empty());
}

TEST_F(CommandIntegrationTest, SpawnAndWaitReportsExitCode) {
  auto cmd = helper({"--exit-code", "3"});
  auto result = cmd.spawn_and_wait();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(result->status.code().value_or(-1), 3);
  EXPECT_FALSE(result->success());

  auto raised = cmd.run();
  ASSERT_FALSE(raised.has_value());
  EXPECT_EQ(raised.error().code, make_error_code(errc::command_failed));
  EXPECT_NE(raised.error().context.find("exit 3"), std::string::npos);
}

TEST_F(CommandIntegrationTest, SignaledChildIsReported) {
  auto cmd = helper({"--raise-signal", std::to_string(SIGTERM)});
  auto result = cmd.spawn_and_wait();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_TRUE(result->signaled());
  EXPECT_EQ(result->termination_signal().value_or(0), SIGTERM);

  auto raised = cmd.run();
  ASSERT_FALSE(raised.has_value());
  EXPECT_EQ(raised.error().code, make_error_code(errc::command_signaled));
}

TEST_F(CommandIntegrationTest, SpawnMissingProgramFails) {
  Command cmd("/definitely/missing/procex_binary");
  auto result = cmd.run();
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().code == std::errc::no_such_file_or_directory)
      << to_string(result.error());
}

TEST_F(CommandIntegrationTest, CwdOverride) {
  auto dir = std::filesystem::temp_directory_path();
  auto cmd = helper({"--print-cwd"});
  cmd.current_dir(dir);
  auto result = cmd.run_with_capture();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(std::filesystem::weakly_canonical(result->stdout_data),
            std::filesystem::weakly_canonical(dir));
}

TEST_F(CommandIntegrationTest, EnvClearAndSet) {
  auto cmd = helper({"--print-env", "PROCEX_TEST_VAR"});
  cmd.env_clear();
  cmd.env("PROCEX_TEST_VAR", "value");
  auto result = cmd.run_with_capture();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(result->stdout_data, "value");

  cmd.env_remove("PROCEX_TEST_VAR");
  auto removed = cmd.run_with_capture();
  ASSERT_TRUE(removed.has_value()) << to_string(removed.error());
  EXPECT_TRUE(removed->stdout_data.empty());
}

TEST_F(CommandIntegrationTest, StdoutFileRedirection) {
  TempFile file("stdout_file");
  write_file(file.path(), "stale contents that must go away");

  auto cmd = helper({"--stdout-text", "fresh"});
  cmd.stdout(Redirection::file(file.path()));
  auto spawned = cmd.spawn_and_wait();
  ASSERT_TRUE(spawned.has_value()) << to_string(spawned.error());
  EXPECT_EQ(read_file(file.path()), "fresh");

  auto ran = cmd.run();
  ASSERT_TRUE(ran.has_value()) << to_string(ran.error());
  EXPECT_EQ(read_file(file.path()), "fresh");
}

TEST_F(CommandIntegrationTest, StdoutFileAppend) {
  TempFile file("stdout_append");
  write_file(file.path(), "first;");

  auto cmd = helper({"--stdout-text", "second;"});
  cmd.stdout(Redirection::file(file.path(), OpenMode::write_append));
  ASSERT_TRUE(cmd.run().has_value());
  ASSERT_TRUE(cmd.spawn_and_wait().has_value());
  EXPECT_EQ(read_file(file.path()), "first;second;second;");
}

TEST_F(CommandIntegrationTest, StdoutFilePermissions) {
  ScopedUmask umask_guard(0);
  TempFile default_file("perms_default");
  TempFile custom_file("perms_custom");

  auto cmd = helper({"--stdout-text", "x"});
  cmd.stdout(Redirection::file(default_file.path()));
  ASSERT_TRUE(cmd.run().has_value());
  cmd.stdout(Redirection::file(custom_file.path(), OpenMode::write_truncate, 0600));
  ASSERT_TRUE(cmd.spawn_and_wait().has_value());

  struct stat info {};
  ASSERT_EQ(::stat(default_file.path().c_str(), &info), 0);
  EXPECT_EQ(info.st_mode & 0777, 0644);
  ASSERT_EQ(::stat(custom_file.path().c_str(), &info), 0);
  EXPECT_EQ(info.st_mode & 0777, 0600);
}

TEST_F(CommandIntegrationTest, StdinFileRedirection) {
  TempFile file("stdin_file");
  write_file(file.path(), "from a file");

  auto cmd = helper({"--echo-stdin"});
  cmd.stdin(Redirection::file(file.path()));
  auto result = cmd.run_with_capture();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(result->stdout_data, "from a file");
}

TEST_F(CommandIntegrationTest, StdinNullAndClose) {
  auto cmd = helper({"--probe-stdin"});
  cmd.stdin(Redirection::null());
  auto null_result = cmd.run_with_capture();
  ASSERT_TRUE(null_result.has_value()) << to_string(null_result.error());
  EXPECT_EQ(null_result->stdout_data, "eof");

  cmd.stdin(Redirection::close());
  auto closed_result = cmd.run_with_capture();
  ASSERT_TRUE(closed_result.has_value()) << to_string(closed_result.error());
  EXPECT_EQ(closed_result->stdout_data, "closed");
}

TEST_F(CommandIntegrationTest, NullRedirectionDiscardsOutput) {
  auto cmd = helper({"--stdout-text", "gone", "--stderr-text", "gone too"});
  cmd.stdout(Redirection::null());
  cmd.stderr(Redirection::null());
  auto result = cmd.run();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_TRUE(result->success());
}

TEST_F(CommandIntegrationTest, StderrAliasesStdoutFile) {
  TempFile file("merged_file");

  auto cmd = helper({"--stdout-text", "out;", "--stderr-text", "err;"});
  cmd.stdout(Redirection::file(file.path()));
  cmd.stderr(Redirection::child(1));
  auto result = cmd.spawn_and_wait();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(read_file(file.path()), "out;err;");
}

TEST_F(CommandIntegrationTest, TeeWritesToFileAndWriter) {
  TempFile file("tee_file");
  StringWriter buffer;

  auto cmd = helper({"--stdout-text", "both places"});
  cmd.stdout(Redirection::tee({Redirection::file(file.path()), Redirection::writer(buffer)}));
  auto result = cmd.run();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(read_file(file.path()), "both places");
  EXPECT_EQ(buffer.str(), "both places");
}

TEST_F(CommandIntegrationTest, LogWriterEmitsOneRecordPerLine) {
  std::ostringstream log;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log);
  sink->set_pattern("%l|%v");
  auto logger = std::make_shared<spdlog::logger>("child_output", sink);

  {
    LogWriter writer(logger, spdlog::level::warn);
    auto cmd = helper({"--stdout-text", "line one\nline two\npartial"});
    cmd.stdout(Redirection::writer(writer));
    auto result = cmd.run();
    ASSERT_TRUE(result.has_value()) << to_string(result.error());
  }
  logger->flush();
  EXPECT_EQ(log.str(), "warning|line one\nwarning|line two\nwarning|partial\n");
}

TEST_F(CommandIntegrationTest, StandardOutputFollowsCurrentHandle) {
  StringWriter captured;
  ScopedStandardOutputOverride override_stdout(captured);

  auto cmd = helper({"--stdout-text", "redirected"});
  cmd.stdout(Redirection::standard_output());
  auto result = cmd.run();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(captured.str(), "redirected");
}

TEST_F(CommandIntegrationTest, StandardOutputWithoutReaderIsReportedAsPipeError) {
  int fds[2] = {-1, -1};
  ASSERT_EQ(::pipe2(fds, O_CLOEXEC), 0);
  ::close(fds[0]);
  FdWriter orphaned(fds[1]);
  ScopedStandardOutputOverride override_stdout(orphaned);

  auto cmd = helper({"--stdout-text", "nobody reads this"});
  cmd.stdout(Redirection::standard_output());
  auto result = cmd.run();
  ::close(fds[1]);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::process_io));
  EXPECT_NE(result.error().context.find("stdout: write: "), std::string::npos)
      << result.error().context;
}

TEST_F(CommandIntegrationTest, ExplicitMonitoredPipeWithSpawnAndWait) {
  StringWriter buffer;
  auto pipe = MonitoredPipe::create(Redirection::writer(buffer));
  ASSERT_TRUE(pipe.has_value()) << to_string(pipe.error());

  auto cmd = helper({"--stdout-bytes", "70000"});
  cmd.stdout(Redirection::pipe(**pipe));
  auto result = cmd.spawn_and_wait();
  (*pipe)->close();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(buffer.str(), std::string(70000, 'a'));
  EXPECT_EQ((*pipe)->state(), MonitoredPipe::State::closed);
}

TEST_F(CommandIntegrationTest, LargePayloadsDoNotDeadlock) {
  constexpr std::size_t kBytes = 1 << 20;
  auto result = helper({"--stdout-bytes", std::to_string(kBytes), "--stderr-bytes",
                        std::to_string(kBytes)})
                    .run_with_capture();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_EQ(result->stdout_data.size(), kBytes);
  EXPECT_EQ(result->stderr_data.size(), kBytes);
}

TEST_F(CommandIntegrationTest, FailingDestinationDoesNotBlockChild) {
  support::FailingWriter failing;
  auto cmd = helper({"--stdout-bytes", std::to_string(1 << 20)});
  cmd.stdout(Redirection::writer(failing));
  auto result = cmd.run();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::process_io));
  EXPECT_EQ(failing.calls, 1);
}

TEST_F(CommandIntegrationTest, TimeoutTerminatesChild) {
  auto cmd = helper({"--sleep-ms", "5000"});

  WaitOptions wait;
  wait.timeout = kShortTimeout;
  auto result = cmd.spawn_and_wait(wait);
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_TRUE(result->timed_out);
  EXPECT_EQ(result->termination_signal().value_or(0), SIGTERM);
  EXPECT_LT(result->elapsed, std::chrono::seconds(4));

  RunOptions options;
  options.wait = wait;
  auto raised = cmd.run(options);
  ASSERT_FALSE(raised.has_value());
  EXPECT_EQ(raised.error().code, make_error_code(errc::timeout));
}

TEST_F(CommandIntegrationTest, TimeoutEscalatesToKill) {
  auto cmd = helper({"--ignore-sigterm", "--sleep-ms", "5000"});
  WaitOptions wait;
  wait.timeout = kShortTimeout;
  wait.kill_grace = std::chrono::milliseconds(100);
  auto result = cmd.spawn_and_wait(wait);
  ASSERT_TRUE(result.has_value()) << to_string(result.error());
  EXPECT_TRUE(result->timed_out);
  EXPECT_EQ(result->termination_signal().value_or(0), SIGKILL);
}

TEST_F(CommandIntegrationTest, TryWaitReturnsEmptyWhileRunning) {
  auto child = helper({"--sleep-ms", "200"}).spawn();
  ASSERT_TRUE(child.has_value()) << to_string(child.error());

  auto running = child->try_wait();
  ASSERT_TRUE(running.has_value()) << to_string(running.error());
  EXPECT_FALSE(running->has_value());

  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << to_string(status.error());
  EXPECT_TRUE(status->success());
}

TEST_F(CommandIntegrationTest, FdCountStableAfterRepeatedRuns) {
  auto cmd = helper({"--stdout-text", "x", "--stderr-text", "y"});
  ASSERT_TRUE(cmd.run_with_capture().has_value());
  std::size_t before = count_open_fds();
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(cmd.run_with_capture().has_value());
    ASSERT_TRUE(cmd.spawn_and_wait().has_value());
  }
  EXPECT_EQ(count_open_fds(), before);
}

TEST_F(CommandIntegrationTest, NoFdLeakIntoChild) {
  auto baseline = baseline_helper_fds(helper_);
  ASSERT_FALSE(baseline.empty());
  std::unordered_set<int> allowed(baseline.begin(), baseline.end());

  TempFile fd_file("child_fds");
  StringWriter buffer;
  auto cmd = helper({"--write-open-fds", fd_file.path().string()});
  cmd.stdout(Redirection::writer(buffer));
  auto result = cmd.run();
  ASSERT_TRUE(result.has_value()) << to_string(result.error());

  auto fds = read_fd_list(fd_file.path());
  ASSERT_FALSE(fds.empty());
  for (int fd : fds) {
    EXPECT_TRUE(allowed.contains(fd)) << "unexpected fd in child: " << fd;
  }
}

#if PROCEX_PLATFORM_POSIX && defined(PROCEX_FORCE_FORK)
class ScopedForkCapture {
 public:
  explicit ScopedForkCapture(bool inject_fd)
      : previous_capture_(g_capture_fork_result.exchange(true, std::memory_order_relaxed)),
        previous_inject_(
            g_open_extra_fd_before_fork.exchange(inject_fd, std::memory_order_relaxed)) {
    g_last_fork_child.store(-1, std::memory_order_relaxed);
    g_last_injected_fd.store(-1, std::memory_order_relaxed);
  }

  ~ScopedForkCapture() {
    g_open_extra_fd_before_fork.store(previous_inject_, std::memory_order_relaxed);
    g_capture_fork_result.store(previous_capture_, std::memory_order_relaxed);
  }

  [[nodiscard]] pid_t last_child_pid() const {
    return g_last_fork_child.load(std::memory_order_relaxed);
  }
  [[nodiscard]] int last_injected_fd() const {
    return g_last_injected_fd.load(std::memory_order_relaxed);
  }

 private:
  bool previous_capture_;
  bool previous_inject_;
};

TEST_F(CommandIntegrationTest, ForkPathClosesFdsOpenedBeforeFork) {
  TempFile fd_file("fork_fds");
  int injected_fd = -1;
  {
    ScopedForkCapture fork_capture(/*inject_fd=*/true);
    auto cmd = helper({"--write-open-fds", fd_file.path().string()});
    cmd.stdout(Redirection::null());
    auto result = cmd.spawn_and_wait();
    ASSERT_TRUE(result.has_value()) << to_string(result.error());
    injected_fd = fork_capture.last_injected_fd();
  }
  ASSERT_GE(injected_fd, kInjectedFdLowerBound);

  auto fds = read_fd_list(fd_file.path());
  ASSERT_FALSE(fds.empty());
  for (int fd : fds) {
    EXPECT_NE(fd, injected_fd);
  }
}

TEST_F(CommandIntegrationTest, ForkExecFailureReapsChild) {
  ScopedForkCapture fork_capture(/*inject_fd=*/false);

  auto result = Command("/definitely/missing/procex_binary").spawn();
  ASSERT_FALSE(result.has_value());

  pid_t child_pid = fork_capture.last_child_pid();
  ASSERT_GT(child_pid, 0);
  int status = 0;
  errno = 0;
  EXPECT_EQ(::waitpid(child_pid, &status, WNOHANG), -1);
  EXPECT_EQ(errno, ECHILD);
}
#endif

}  // namespace procex
