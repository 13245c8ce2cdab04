#include "procex/writer.hpp"

#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "procex/internal/fd.hpp"

namespace procex {

Result<std::size_t> StringWriter::write(std::string_view data) {
  buffer_.append(data);
  return data.size();
}

std::string StringWriter::take() noexcept {
  std::string out = std::move(buffer_);
  buffer_.clear();
  return out;
}

Result<std::size_t> FdWriter::write(std::string_view data) {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::closed_stream), .context = "fd writer"};
  }
  return internal::write_all_fd(fd_, data);
}

Result<std::size_t> StreamWriter::write(std::string_view data) {
  stream_->write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!*stream_) {
    return Error{.code = make_error_code(errc::write_failed), .context = "ostream"};
  }
  return data.size();
}

LogWriter::LogWriter(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()), level_(level) {}

LogWriter::~LogWriter() { flush(); }

Result<std::size_t> LogWriter::write(std::string_view data) {
  std::size_t start = 0;
  while (true) {
    auto newline = data.find('\n', start);
    if (newline == std::string_view::npos) {
      break;
    }
    pending_.append(data.substr(start, newline - start));
    logger_->log(level_, "{}", pending_);
    pending_.clear();
    start = newline + 1;
  }
  pending_.append(data.substr(start));
  return data.size();
}

void LogWriter::flush() {
  if (pending_.empty()) {
    return;
  }
  logger_->log(level_, "{}", pending_);
  pending_.clear();
}

}  // namespace procex
