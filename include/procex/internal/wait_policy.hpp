#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "procex/child.hpp"
#include "procex/result.hpp"
#include "procex/status.hpp"

namespace procex::internal {

// Time source for the wait policy and run timing. Tests install a fake one.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::chrono::steady_clock::time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class ScopedClockOverride {
 public:
  explicit ScopedClockOverride(Clock& clock);
  ~ScopedClockOverride();
  ScopedClockOverride(const ScopedClockOverride&) = delete;
  ScopedClockOverride& operator=(const ScopedClockOverride&) = delete;

 private:
  Clock* previous_ = nullptr;
};

Clock& default_clock();

struct WaitOps {
  std::function<Result<std::optional<ExitStatus>>()> try_wait;
  std::function<Result<ExitStatus>()> wait_blocking;
  std::function<Result<void>()> terminate;
  std::function<Result<void>()> kill;
};

// Rejects negative timeouts and grace periods.
Result<void> validate_wait_options(const WaitOptions& options);

// Without a timeout this is a plain blocking wait. Otherwise polls until the
// deadline, then terminate, kill_grace, kill, and a final blocking reap.
Result<WaitOutcome> wait_with_timeout(WaitOps& ops, Clock& clock,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      std::chrono::milliseconds kill_grace);

}  // namespace procex::internal
