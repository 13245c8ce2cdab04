#pragma once

#include <sys/stat.h>

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace procex {

class MonitoredPipe;
class Writer;

/// @brief File open modes for file redirections.
enum class OpenMode {
  /// @brief Read-only.
  read,
  /// @brief Write-only; create and truncate.
  write_truncate,
  /// @brief Write-only; create and append.
  write_append,
  /// @brief Read/write; create if missing.
  read_write,
};

/// @brief POSIX file permission bits (mode_t).
using FilePerms = ::mode_t;

/// @brief File specification for a redirection.
struct FileSpec {
  /// @brief Path to the file.
  std::filesystem::path path;
  /// @brief Optional open mode; defaults based on the redirected stream.
  std::optional<OpenMode> mode;
  /// @brief Optional permissions for new files.
  std::optional<FilePerms> perms;
};

/// @brief Where a child's stream goes (or, for stdin, comes from).
///
/// Some alternatives can be applied directly when the child is spawned (null, close,
/// child aliasing, descriptors, files). Writers and tees only work through a
/// MonitoredPipe, which Command::run sets up automatically.
struct Redirection {
  /// @brief Attach to the null device.
  struct Null {};
  /// @brief Close the descriptor in the child.
  struct Close {};
  /// @brief Alias another descriptor of the child (e.g. stderr to the child's stdout).
  struct Child {
    /// @brief Descriptor number inside the child.
    int fd;
  };
  /// @brief The parent's standard output handle.
  struct Stdout {};
  /// @brief The parent's standard error handle.
  struct Stderr {};
  /// @brief A caller-owned file descriptor.
  struct Fd {
    /// @brief Native file descriptor.
    int fd;
  };
  /// @brief Open a file path for redirection.
  using File = FileSpec;
  /// @brief A caller-owned Writer; not owned by the redirection.
  struct Sink {
    /// @brief Target writer.
    Writer* writer;
  };
  /// @brief Another monitored pipe; not owned by the redirection.
  struct Pipe {
    /// @brief Target pipe.
    MonitoredPipe* pipe;
  };
  /// @brief Fan out to several redirections.
  struct Tee {
    /// @brief Nested redirections, written in order.
    std::vector<Redirection> targets;
  };

  /// @brief Variant holding the redirection selection.
  std::variant<Null, Close, Child, Stdout, Stderr, Fd, File, Sink, Pipe, Tee> value;

  /// @brief Redirect to the null device.
  static Redirection null() { return Redirection{Null{}}; }
  /// @brief Close the stream in the child.
  static Redirection close() { return Redirection{Close{}}; }
  /// @brief Alias to another descriptor in the child.
  static Redirection child(int fd) { return Redirection{Child{fd}}; }
  /// @brief Forward to the process-wide standard output.
  static Redirection standard_output() { return Redirection{Stdout{}}; }
  /// @brief Forward to the process-wide standard error.
  static Redirection standard_error() { return Redirection{Stderr{}}; }
  /// @brief Write to a caller-owned file descriptor.
  static Redirection fd(int fd) { return Redirection{Fd{fd}}; }
  /// @brief Redirect to a file path.
  static Redirection file(std::filesystem::path path) {
    return Redirection{FileSpec{std::move(path), std::nullopt, std::nullopt}};
  }
  /// @brief Redirect to a file path with an explicit open mode.
  static Redirection file(std::filesystem::path path, OpenMode mode) {
    return Redirection{FileSpec{std::move(path), mode, std::nullopt}};
  }
  /// @brief Redirect to a file path with explicit mode and permissions.
  static Redirection file(std::filesystem::path path, OpenMode mode, FilePerms perms) {
    return Redirection{FileSpec{std::move(path), mode, perms}};
  }
  /// @brief Redirect to a file path with full specification.
  static Redirection file(FileSpec spec) { return Redirection{std::move(spec)}; }
  /// @brief Forward to a caller-owned writer.
  static Redirection writer(Writer& target) { return Redirection{Sink{&target}}; }
  /// @brief Forward to another monitored pipe.
  static Redirection pipe(MonitoredPipe& target) { return Redirection{Pipe{&target}}; }
  /// @brief Fan out to several redirections.
  static Redirection tee(std::vector<Redirection> targets);
  /// @brief Fan out to several redirections.
  static Redirection tee(std::initializer_list<Redirection> targets);
};

/// @brief Human-readable rendering used in error messages.
std::string to_string(const Redirection& redirection);

}  // namespace procex
