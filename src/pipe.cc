#include "procex/pipe.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>

namespace procex {

namespace {

Error closed_end(const char* operation) {
  return Error{.code = make_error_code(errc::closed_stream), .context = operation};
}

}  // namespace

Result<bool> PipeReader::wait_readable(std::chrono::milliseconds timeout) const {
  if (!fd_) {
    return closed_end("poll");
  }
  return internal::wait_readable(fd_.get(), timeout);
}

Result<std::size_t> PipeReader::read_some(void* data, std::size_t n) const {
  if (!fd_) {
    return closed_end("read");
  }
  while (true) {
    ssize_t rv = ::read(fd_.get(), data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno != EINTR) {
      return internal::errno_error("read");
    }
  }
}

Result<std::string> PipeReader::read_all() const {
  std::string out;
  std::array<char, 8192> buffer{};
  while (true) {
    auto count = read_some(buffer.data(), buffer.size());
    if (!count) {
      return count.error();
    }
    if (*count == 0) {
      return out;
    }
    out.append(buffer.data(), *count);
  }
}

Result<std::size_t> PipeWriter::write_all(std::string_view data) const {
  if (!fd_) {
    return closed_end("write");
  }
  return internal::write_all_fd(fd_.get(), data);
}

Result<PipePair> make_pipe() {
  auto fds = internal::create_pipe();
  if (!fds) {
    return fds.error();
  }
  return PipePair{PipeReader(fds->first.release()), PipeWriter(fds->second.release())};
}

}  // namespace procex
