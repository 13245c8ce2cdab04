#pragma once

#include <optional>

#include "procex/command.hpp"
#include "procex/internal/access.hpp"
#include "procex/internal/backend.hpp"
#include "procex/redirection.hpp"
#include "procex/result.hpp"

namespace procex::internal {

// Replacements applied on top of the command's own redirections, e.g. the
// monitored pipes that Command::run substitutes for stdout and stderr.
struct StdioOverride {
  std::optional<Redirection> stdin_override;
  std::optional<Redirection> stdout_override;
  std::optional<Redirection> stderr_override;
};

Result<SpawnSpec> lower_command(const Command& cmd, const StdioOverride* override_stdio);

}  // namespace procex::internal
