#include "procex/standard_streams.hpp"

#include <unistd.h>

#include <atomic>

namespace procex {

namespace {

std::atomic<Writer*> g_stdout_override{nullptr};
std::atomic<Writer*> g_stderr_override{nullptr};

}  // namespace

Writer& standard_output() noexcept {
  if (auto* override_writer = g_stdout_override.load()) {
    return *override_writer;
  }
  static FdWriter writer(STDOUT_FILENO);
  return writer;
}

Writer& standard_error() noexcept {
  if (auto* override_writer = g_stderr_override.load()) {
    return *override_writer;
  }
  static FdWriter writer(STDERR_FILENO);
  return writer;
}

ScopedStandardOutputOverride::ScopedStandardOutputOverride(Writer& writer) noexcept
    : previous_(g_stdout_override.exchange(&writer)) {}

ScopedStandardOutputOverride::~ScopedStandardOutputOverride() {
  g_stdout_override.store(previous_);
}

ScopedStandardErrorOverride::ScopedStandardErrorOverride(Writer& writer) noexcept
    : previous_(g_stderr_override.exchange(&writer)) {}

ScopedStandardErrorOverride::~ScopedStandardErrorOverride() { g_stderr_override.store(previous_); }

}  // namespace procex
