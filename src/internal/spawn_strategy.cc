#include "procex/internal/spawn_strategy.hpp"

#include <spawn.h>

namespace procex::internal {

namespace {

constexpr bool kHasSpawnPgroup =
#ifdef POSIX_SPAWN_SETPGROUP
    true;
#else
    false;
#endif

constexpr bool kHasSpawnChdir = PROCEX_HAS_SPAWN_CHDIR != 0;

}  // namespace

const char* to_string(SpawnStrategy strategy) noexcept {
  switch (strategy) {
    case SpawnStrategy::fork_exec:
      return "fork_exec";
    case SpawnStrategy::posix_spawn:
      return "posix_spawn";
  }
  return "unknown";
}

std::optional<std::string_view> posix_spawn_blocker(const SpawnSpec& spec) {
  if (spec.cwd && !kHasSpawnChdir) {
    return "current_dir needs posix_spawn_file_actions_addchdir_np";
  }
  if (spec.opts.new_process_group && !kHasSpawnPgroup) {
    return "new_process_group needs POSIX_SPAWN_SETPGROUP";
  }
  return std::nullopt;
}

SpawnStrategy select_spawn_strategy(const SpawnSpec& spec) {
#if defined(PROCEX_FORCE_FORK)
  (void)spec;
  return SpawnStrategy::fork_exec;
#else
  return can_use_posix_spawn(spec) ? SpawnStrategy::posix_spawn : SpawnStrategy::fork_exec;
#endif
}

}  // namespace procex::internal
