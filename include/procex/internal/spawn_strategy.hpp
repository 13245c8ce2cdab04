#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "procex/internal/backend.hpp"

// posix_spawn_file_actions_addchdir_np: macOS, and glibc since 2.29.
#if PROCEX_PLATFORM_MACOS
#define PROCEX_HAS_SPAWN_CHDIR 1
#elif defined(__GLIBC__) && defined(__GLIBC_MINOR__) && \
    (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 29))
#define PROCEX_HAS_SPAWN_CHDIR 1
#else
#define PROCEX_HAS_SPAWN_CHDIR 0
#endif

namespace procex::internal {

enum class SpawnStrategy : std::uint8_t { fork_exec, posix_spawn };

const char* to_string(SpawnStrategy strategy) noexcept;

// First requested feature that posix_spawn cannot express on this platform.
std::optional<std::string_view> posix_spawn_blocker(const SpawnSpec& spec);

inline bool can_use_posix_spawn(const SpawnSpec& spec) { return !posix_spawn_blocker(spec); }

// posix_spawn whenever possible; fork/exec otherwise, or always when built
// with PROCEX_FORCE_FORK.
SpawnStrategy select_spawn_strategy(const SpawnSpec& spec);

}  // namespace procex::internal
