#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "procex/child.hpp"
#include "procex/command.hpp"
#include "procex/redirection.hpp"

namespace procex::internal {

struct Spawned;

// Friend shims: the library reads Command's builder state and builds Child
// handles without widening either public interface.
struct CommandAccess {
  static const std::vector<std::string>& argv(const Command& cmd) { return cmd.argv_; }
  static const std::optional<std::filesystem::path>& cwd(const Command& cmd) { return cmd.cwd_; }
  static bool inherit_env(const Command& cmd) { return cmd.inherit_env_; }
  static const std::map<std::string, std::optional<std::string>, std::less<>>& env_delta(
      const Command& cmd) {
    return cmd.env_delta_;
  }
  static const std::optional<Redirection>& stdin_opt(const Command& cmd) { return cmd.stdin_; }
  static const std::optional<Redirection>& stdout_opt(const Command& cmd) { return cmd.stdout_; }
  static const std::optional<Redirection>& stderr_opt(const Command& cmd) { return cmd.stderr_; }
  static const SpawnOptions& options(const Command& cmd) { return cmd.opts_; }
};

struct ChildAccess {
  static std::unique_ptr<Child::Impl>& impl(Child& child) { return child.impl_; }
  static Child from_spawned(Spawned spawned);
};

}  // namespace procex::internal
