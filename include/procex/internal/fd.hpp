#pragma once

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <string_view>
#include <utility>

#include "procex/platform.hpp"
#include "procex/redirection.hpp"
#include "procex/result.hpp"

namespace procex::internal {

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

inline Error errno_error(const char* context) {
  return Error{.code = std::error_code(errno, std::system_category()), .context = context};
}

inline constexpr FilePerms kDefaultFilePerms = 0644;

inline int open_flags_for(OpenMode mode) {
  switch (mode) {
    case OpenMode::read:
      return O_RDONLY;
    case OpenMode::write_truncate:
      return O_WRONLY | O_CREAT | O_TRUNC;
    case OpenMode::write_append:
      return O_WRONLY | O_CREAT | O_APPEND;
    case OpenMode::read_write:
      return O_RDWR | O_CREAT;
  }
  return O_RDONLY;
}

inline Result<void> set_cloexec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  if (flags == -1) {
    return errno_error("fcntl(F_GETFD)");
  }
  if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return errno_error("fcntl(F_SETFD)");
  }
  return {};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    return errno_error("fcntl(F_GETFL)");
  }
  if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return errno_error("fcntl(F_SETFL)");
  }
  return {};
}

inline Result<std::pair<unique_fd, unique_fd>> create_pipe() {
#if PROCEX_PLATFORM_LINUX
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return errno_error("pipe2");
  }
  return std::make_pair(unique_fd(fds[0]), unique_fd(fds[1]));
#else
  std::array<int, 2> fds{};
  if (::pipe(fds.data()) == -1) {
    return errno_error("pipe");
  }
  unique_fd read_end(fds[0]);
  unique_fd write_end(fds[1]);
  auto cloexec0 = set_cloexec(read_end.get());
  if (!cloexec0) {
    return cloexec0.error();
  }
  auto cloexec1 = set_cloexec(write_end.get());
  if (!cloexec1) {
    return cloexec1.error();
  }
  return std::make_pair(std::move(read_end), std::move(write_end));
#endif
}

// Blocks SIGPIPE on the calling thread so that writing to a pipe or socket with no
// reader fails with EPIPE instead of ending the process. A SIGPIPE raised inside the
// scope is consumed before the previous mask is restored; one that was already
// pending on entry is left alone.
class ScopedSigpipeBlock {
 public:
  ScopedSigpipeBlock() noexcept {
    sigset_t pending;
    sigemptyset(&pending);
    if (::sigpending(&pending) == 0) {
      was_pending_ = sigismember(&pending, SIGPIPE) == 1;
    }
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    blocked_ = ::pthread_sigmask(SIG_BLOCK, &block, &previous_) == 0;
  }

  ~ScopedSigpipeBlock() {
    if (!blocked_) {
      return;
    }
    if (raised_ && !was_pending_) {
      sigset_t pipe_only;
      sigemptyset(&pipe_only);
      sigaddset(&pipe_only, SIGPIPE);
      timespec no_wait{0, 0};
      while (::sigtimedwait(&pipe_only, nullptr, &no_wait) == -1 && errno == EINTR) {
      }
    }
    ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
  ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

  // Call after a write failed with EPIPE.
  void note_raised() noexcept { raised_ = true; }

 private:
  sigset_t previous_{};
  bool blocked_ = false;
  bool was_pending_ = false;
  bool raised_ = false;
};

// Writes the whole buffer, retrying short writes and EINTR. Blocks on a full pipe.
// A reader that went away is reported as EPIPE, never as SIGPIPE.
inline Result<std::size_t> write_all_fd(int fd, std::string_view data) {
  ScopedSigpipeBlock sigpipe_block;
  std::size_t offset = 0;
  while (offset < data.size()) {
    ssize_t rv = ::write(fd, data.data() + offset, data.size() - offset);
    if (rv > 0) {
      offset += static_cast<std::size_t>(rv);
      continue;
    }
    if (rv == 0) {
      return Error{.code = make_error_code(errc::write_failed), .context = "write"};
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EPIPE) {
      sigpipe_block.note_raised();
      return errno_error("write");
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      pollfd pfd{fd, POLLOUT, 0};
      if (::poll(&pfd, 1, -1) == -1 && errno != EINTR) {
        return errno_error("poll");
      }
      continue;
    }
    return errno_error("write");
  }
  return data.size();
}

// Bounded wait for readability; returns false on timeout.
inline Result<bool> wait_readable(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd{fd, POLLIN, 0};
  int rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rv == -1) {
    if (errno == EINTR) {
      return false;
    }
    return errno_error("poll");
  }
  return rv > 0;
}

}  // namespace procex::internal
