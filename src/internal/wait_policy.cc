#include "procex/internal/wait_policy.hpp"

#include <atomic>
#include <thread>

namespace procex::internal {

namespace {

class SteadyClock final : public Clock {
 public:
  std::chrono::steady_clock::time_point now() override { return std::chrono::steady_clock::now(); }

  void sleep_for(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

std::atomic<Clock*> g_clock_override{nullptr};

constexpr auto kSleepStep = std::chrono::milliseconds(1);

// Polls until the deadline. Returns the status if the child exited in time.
Result<std::optional<ExitStatus>> poll_until(WaitOps& ops, Clock& clock,
                                             std::chrono::steady_clock::time_point deadline) {
  while (clock.now() < deadline) {
    auto wait_result = ops.try_wait();
    if (!wait_result) {
      return wait_result.error();
    }
    if (wait_result->has_value()) {
      return wait_result.value();
    }
    clock.sleep_for(kSleepStep);
  }
  return std::optional<ExitStatus>();
}

}  // namespace

ScopedClockOverride::ScopedClockOverride(Clock& clock)
    : previous_(g_clock_override.exchange(&clock)) {}

ScopedClockOverride::~ScopedClockOverride() { g_clock_override.store(previous_); }

Clock& default_clock() {
  if (auto* override_clock = g_clock_override.load()) {
    return *override_clock;
  }
  static SteadyClock clock;
  return clock;
}

Result<void> validate_wait_options(const WaitOptions& options) {
  if (options.timeout && options.timeout->count() < 0) {
    return Error{.code = make_error_code(errc::invalid_argument),
                 .context = "timeout must not be negative"};
  }
  if (options.kill_grace.count() < 0) {
    return Error{.code = make_error_code(errc::invalid_argument),
                 .context = "kill_grace must not be negative"};
  }
  return {};
}

Result<WaitOutcome> wait_with_timeout(WaitOps& ops, Clock& clock,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      std::chrono::milliseconds kill_grace) {
  if (!timeout) {
    auto status = ops.wait_blocking();
    if (!status) {
      return status.error();
    }
    return WaitOutcome{.status = status.value(), .timed_out = false};
  }

  auto exited = poll_until(ops, clock, clock.now() + *timeout);
  if (!exited) {
    return exited.error();
  }
  if (exited->has_value()) {
    return WaitOutcome{.status = **exited, .timed_out = false};
  }

  auto term_result = ops.terminate();
  if (!term_result) {
    return term_result.error();
  }

  auto graceful = poll_until(ops, clock, clock.now() + kill_grace);
  if (!graceful) {
    return graceful.error();
  }
  if (graceful->has_value()) {
    return WaitOutcome{.status = **graceful, .timed_out = true};
  }

  auto kill_result = ops.kill();
  if (!kill_result) {
    return kill_result.error();
  }

  auto status = ops.wait_blocking();
  if (!status) {
    return status.error();
  }
  return WaitOutcome{.status = status.value(), .timed_out = true};
}

}  // namespace procex::internal
