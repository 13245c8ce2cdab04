#include "procex/monitored_pipe.hpp"

#include <array>
#include <exception>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "procex/internal/fd.hpp"

namespace procex {

namespace {

std::atomic<std::size_t> g_open_instances{0};

}  // namespace

const char* to_string(MonitoredPipe::State state) noexcept {
  switch (state) {
    case MonitoredPipe::State::open:
      return "open";
    case MonitoredPipe::State::closing:
      return "closing";
    case MonitoredPipe::State::closed:
      return "closed";
  }
  return "unknown";
}

Result<std::unique_ptr<MonitoredPipe>> MonitoredPipe::create(const Redirection& redirection,
                                                             std::size_t chunk_size) {
  if (chunk_size == 0) {
    return Error{.code = make_error_code(errc::invalid_argument),
                 .context = "chunk_size must be positive"};
  }
  auto destination = make_destination(redirection);
  if (!destination) {
    return destination.error();
  }
  if (!(*destination)->compatible_with_monitored_pipe()) {
    auto kind = (*destination)->kind();
    (*destination)->close();
    return Error{.code = make_error_code(errc::incompatible_destination),
                 .context = std::string(to_string(kind)) + " " + to_string(redirection)};
  }

  auto ends = make_pipe();
  if (!ends) {
    (*destination)->close();
    return ends.error();
  }
  auto nonblocking = internal::set_nonblocking(ends->reader.native_handle());
  if (!nonblocking) {
    (*destination)->close();
    return nonblocking.error();
  }

  auto pipe = std::make_unique<MonitoredPipe>(ConstructionTag{}, std::move(destination.value()),
                                              std::move(ends->reader), std::move(ends->writer),
                                              chunk_size);
  auto started = pipe->start();
  if (!started) {
    return started.error();
  }
  return pipe;
}

std::unique_ptr<MonitoredPipe> MonitoredPipe::create_or_throw(const Redirection& redirection,
                                                              std::size_t chunk_size) {
  auto result = create(redirection, chunk_size);
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

MonitoredPipe::MonitoredPipe(ConstructionTag /*tag*/, std::unique_ptr<Destination> destination,
                             PipeReader reader, PipeWriter writer, std::size_t chunk_size)
    : destination_(std::move(destination)),
      reader_(std::move(reader)),
      buffer_(chunk_size, '\0'),
      writer_(std::move(writer)) {
  g_open_instances.fetch_add(1);
}

MonitoredPipe::~MonitoredPipe() { close(); }

std::size_t MonitoredPipe::open_instance_count() noexcept { return g_open_instances.load(); }

Result<void> MonitoredPipe::start() {
  monitoring_.store(true);
  try {
    thread_ = std::thread([this] { monitor(); });
  } catch (const std::system_error& e) {
    monitoring_.store(false);
    std::lock_guard<std::mutex> lock(mutex_);
    writer_.close();
    reader_.close();
    state_.store(State::closed);
    return Error{.code = e.code(), .context = "start monitor thread"};
  }
  return {};
}

Result<std::size_t> MonitoredPipe::write(std::string_view data) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.load() != State::open) {
    return Error{.code = make_error_code(errc::closed_stream), .context = "monitored pipe"};
  }
  return writer_.write_all(data);
}

void MonitoredPipe::close() noexcept {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_.load() == State::open) {
      state_.store(State::closing);
    }
    closed_cv_.wait(lock, [this] { return state_.load() == State::closed; });
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!destination_closed_) {
    destination_closed_ = true;
    destination_->close();
    g_open_instances.fetch_sub(1);
  }
}

int MonitoredPipe::native_handle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writer_.native_handle();
}

std::optional<Error> MonitoredPipe::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void MonitoredPipe::monitor() noexcept {
  while (state_.load() == State::open) {
    auto result = pump();
    if (result == Pump::failed || result == Pump::eof) {
      break;
    }
  }
  close_pipe();
}

MonitoredPipe::Pump MonitoredPipe::pump() {
  auto readable = reader_.wait_readable(kPollInterval);
  if (!readable) {
    record_failure(readable.error());
    return Pump::failed;
  }
  if (!*readable) {
    return Pump::idle;
  }
  auto count = reader_.read_some(buffer_.data(), buffer_.size());
  if (!count && count.error().code == std::errc::resource_unavailable_try_again) {
    return Pump::idle;
  }
  if (!count) {
    record_failure(count.error());
    return Pump::failed;
  }
  if (*count == 0) {
    return Pump::eof;
  }
  if (auto failure = forward(std::string_view(buffer_.data(), *count))) {
    record_failure(std::move(*failure));
    return Pump::failed;
  }
  return Pump::forwarded;
}

std::optional<Error> MonitoredPipe::forward(std::string_view chunk) noexcept {
  try {
    auto written = destination_->write(chunk);
    if (!written) {
      return written.error();
    }
    return std::nullopt;
  } catch (const std::exception& e) {
    return Error{.code = make_error_code(errc::write_failed), .context = e.what()};
  } catch (...) {
    return Error{.code = make_error_code(errc::write_failed), .context = "unknown exception"};
  }
}

void MonitoredPipe::record_failure(Error error) {
  std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
  // The owner may hold the lock while blocked writing into a full pipe. Keep
  // draining (and dropping) bytes until it lets go.
  std::array<char, 4096> scratch{};
  while (!lock.try_lock()) {
    auto readable = reader_.wait_readable(kPollInterval);
    if (readable && *readable && !reader_.read_some(scratch.data(), scratch.size())) {
      std::this_thread::yield();
    }
  }
  spdlog::debug("monitored pipe: {} destination failed: {}", to_string(destination_->kind()),
                to_string(error));
  if (!error_) {
    error_ = std::move(error);
  }
  if (state_.load() == State::open) {
    state_.store(State::closing);
  }
}

void MonitoredPipe::close_pipe() {
  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() == State::open) {
      state_.store(State::closing);
    }
    writer_.close();
    failed = error_.has_value();
  }
  if (!failed) {
    while (true) {
      auto result = pump();
      if (result == Pump::eof || result == Pump::failed) {
        break;
      }
    }
  }
  reader_.close();
  monitoring_.store(false);
  std::lock_guard<std::mutex> lock(mutex_);
  state_.store(State::closed);
  closed_cv_.notify_all();
}

}  // namespace procex
