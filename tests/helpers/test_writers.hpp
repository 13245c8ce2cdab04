#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "procex/result.hpp"
#include "procex/writer.hpp"

namespace procex::support {

// Accepts `accept_calls` writes, then fails every write after that.
class FailingWriter final : public Writer {
 public:
  explicit FailingWriter(int accept_calls = 0) : accept_calls_(accept_calls) {}

  Result<std::size_t> write(std::string_view data) override {
    ++calls;
    if (calls > accept_calls_) {
      return Error{.code = make_error_code(errc::write_failed), .context = "failing writer"};
    }
    received.append(data);
    return data.size();
  }

  int calls = 0;
  std::string received;

 private:
  int accept_calls_;
};

class ThrowingWriter final : public Writer {
 public:
  Result<std::size_t> write(std::string_view /*data*/) override {
    throw std::runtime_error("writer exploded");
  }
};

// Sleeps before every write, to keep data queued in the pipe.
class SlowWriter final : public Writer {
 public:
  explicit SlowWriter(std::chrono::milliseconds delay) : delay_(delay) {}

  Result<std::size_t> write(std::string_view data) override {
    std::this_thread::sleep_for(delay_);
    received.append(data);
    return data.size();
  }

  std::string received;

 private:
  std::chrono::milliseconds delay_;
};

}  // namespace procex::support
