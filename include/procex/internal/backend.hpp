#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "procex/child.hpp"
#include "procex/command.hpp"
#include "procex/redirection.hpp"
#include "procex/result.hpp"
#include "procex/status.hpp"

namespace procex::internal {

// Spawn-time form of a redirection. `child` aliases another descriptor of the
// child and is applied after every other kind.
struct StdioSpec {
  enum class Kind : std::uint8_t { inherit, null, fd, file, close, child };

  Kind kind = Kind::inherit;
  int fd = -1;
  std::filesystem::path path;
  OpenMode mode = OpenMode::read;
  std::optional<FilePerms> perms;
};

struct SpawnSpec {
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> cwd;
  std::vector<std::string> envp;

  StdioSpec stdin_spec;
  StdioSpec stdout_spec;
  StdioSpec stderr_spec;

  SpawnOptions opts;
};

struct Spawned {
  int pid = -1;
  std::optional<int> pgid;
  bool new_process_group = false;
};

class Backend {
 public:
  virtual ~Backend() = default;
  virtual Result<Spawned> spawn(const SpawnSpec& spec) = 0;
  virtual Result<WaitOutcome> wait(Spawned& spawned,
                                   std::optional<std::chrono::milliseconds> timeout,
                                   std::chrono::milliseconds kill_grace) = 0;
  virtual Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) = 0;
  virtual Result<void> terminate(Spawned& spawned) = 0;
  virtual Result<void> kill(Spawned& spawned) = 0;
  virtual Result<void> signal(Spawned& spawned, int signo) = 0;
};

class ScopedBackendOverride {
 public:
  explicit ScopedBackendOverride(Backend& backend);
  ~ScopedBackendOverride();
  ScopedBackendOverride(const ScopedBackendOverride&) = delete;
  ScopedBackendOverride& operator=(const ScopedBackendOverride&) = delete;

 private:
  Backend* previous_ = nullptr;
};

Backend& default_backend();

}  // namespace procex::internal
