#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Centralized platform detection macros.
// Values are 0 or 1 for use in #if expressions.

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define PROCEX_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define PROCEX_PLATFORM_MACOS 0
#endif

#if defined(__linux__)
/// @brief True when building for Linux.
#define PROCEX_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define PROCEX_PLATFORM_LINUX 0
#endif

#if defined(__unix__) || PROCEX_PLATFORM_MACOS || PROCEX_PLATFORM_LINUX
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCEX_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCEX_PLATFORM_POSIX 0
#endif

#if !PROCEX_PLATFORM_POSIX
#error "procex supports POSIX platforms only"
#endif

#if __cplusplus < 202002L
#error "procex requires at least C++20"
#endif

#if defined(__has_feature)
#if __has_feature(thread_sanitizer)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when compiled with ThreadSanitizer (clang spelling).
#define PROCEX_HAS_THREAD_SANITIZER 1
#endif
#endif
#if !defined(PROCEX_HAS_THREAD_SANITIZER) && defined(__SANITIZE_THREAD__)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when compiled with ThreadSanitizer (gcc spelling).
#define PROCEX_HAS_THREAD_SANITIZER 1
#endif
#if !defined(PROCEX_HAS_THREAD_SANITIZER)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when compiled with ThreadSanitizer.
#define PROCEX_HAS_THREAD_SANITIZER 0
#endif
