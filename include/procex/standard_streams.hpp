#pragma once

#include "procex/writer.hpp"

namespace procex {

/// @brief Current process-wide standard output handle.
///
/// Defaults to an FdWriter on descriptor 1. Destinations that target standard
/// output capture this handle when they are created.
Writer& standard_output() noexcept;
/// @brief Current process-wide standard error handle (FdWriter on descriptor 2 by default).
Writer& standard_error() noexcept;

/// @brief RAII override of the standard output handle.
class ScopedStandardOutputOverride {
 public:
  /// @brief Install the writer as standard output until destruction.
  explicit ScopedStandardOutputOverride(Writer& writer) noexcept;
  /// @brief Restore the previous handle.
  ~ScopedStandardOutputOverride();

  ScopedStandardOutputOverride(const ScopedStandardOutputOverride&) = delete;
  ScopedStandardOutputOverride& operator=(const ScopedStandardOutputOverride&) = delete;

 private:
  Writer* previous_;
};

/// @brief RAII override of the standard error handle.
class ScopedStandardErrorOverride {
 public:
  /// @brief Install the writer as standard error until destruction.
  explicit ScopedStandardErrorOverride(Writer& writer) noexcept;
  /// @brief Restore the previous handle.
  ~ScopedStandardErrorOverride();

  ScopedStandardErrorOverride(const ScopedStandardErrorOverride&) = delete;
  ScopedStandardErrorOverride& operator=(const ScopedStandardErrorOverride&) = delete;

 private:
  Writer* previous_;
};

}  // namespace procex
