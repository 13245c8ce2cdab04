#include "procex/destination.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <string>
#include <type_traits>
#include <vector>

#include "procex/internal/fd.hpp"
#include "procex/monitored_pipe.hpp"
#include "procex/standard_streams.hpp"
#include "procex/writer.hpp"

namespace procex {

namespace {

using DestinationPtr = std::unique_ptr<Destination>;

// Spawn-time markers. They have no meaning once bytes flow through a pipe.
class MarkerDestination final : public Destination {
 public:
  MarkerDestination(Redirection redirection, DestinationKind kind)
      : Destination(std::move(redirection)), kind_(kind) {}

  Result<std::size_t> write(std::string_view /*data*/) override { return std::size_t{0}; }
  [[nodiscard]] bool compatible_with_monitored_pipe() const noexcept override { return false; }
  [[nodiscard]] DestinationKind kind() const noexcept override { return kind_; }

 private:
  DestinationKind kind_;
};

// Forwards to a writer the destination does not own.
class ForwardingDestination final : public Destination {
 public:
  ForwardingDestination(Redirection redirection, DestinationKind kind, Writer& target)
      : Destination(std::move(redirection)), kind_(kind), target_(&target) {}

  Result<std::size_t> write(std::string_view data) override { return target_->write(data); }
  [[nodiscard]] DestinationKind kind() const noexcept override { return kind_; }

 private:
  DestinationKind kind_;
  Writer* target_;
};

class FileDescriptorDestination final : public Destination {
 public:
  FileDescriptorDestination(Redirection redirection, int fd)
      : Destination(std::move(redirection)), fd_(fd) {}

  // The caller keeps ownership of fd_; each write goes through a short-lived duplicate.
  Result<std::size_t> write(std::string_view data) override {
    internal::unique_fd transient(::fcntl(fd_, F_DUPFD_CLOEXEC, 0));
    if (!transient) {
      return internal::errno_error("fcntl(F_DUPFD_CLOEXEC)");
    }
    return internal::write_all_fd(transient.get(), data);
  }
  [[nodiscard]] DestinationKind kind() const noexcept override {
    return DestinationKind::file_descriptor;
  }

 private:
  int fd_;
};

class FileDestination final : public Destination {
 public:
  FileDestination(Redirection redirection, DestinationKind kind, internal::unique_fd fd)
      : Destination(std::move(redirection)), kind_(kind), fd_(std::move(fd)) {}

  Result<std::size_t> write(std::string_view data) override {
    if (!fd_) {
      return Error{.code = make_error_code(errc::closed_stream), .context = "file destination"};
    }
    return internal::write_all_fd(fd_.get(), data);
  }
  void close() noexcept override { fd_.reset(-1); }
  [[nodiscard]] DestinationKind kind() const noexcept override { return kind_; }

 private:
  DestinationKind kind_;
  internal::unique_fd fd_;
};

class TeeDestination final : public Destination {
 public:
  TeeDestination(Redirection redirection, std::vector<DestinationPtr> children)
      : Destination(std::move(redirection)), children_(std::move(children)) {}

  // Children are written in order; the first failure ends the write.
  Result<std::size_t> write(std::string_view data) override {
    for (auto& child : children_) {
      auto written = child->write(data);
      if (!written) {
        return written.error();
      }
    }
    return data.size();
  }
  void close() noexcept override {
    for (auto& child : children_) {
      child->close();
    }
  }
  [[nodiscard]] DestinationKind kind() const noexcept override { return DestinationKind::tee; }

 private:
  std::vector<DestinationPtr> children_;
};

class MonitoredPipeDestination final : public Destination {
 public:
  MonitoredPipeDestination(Redirection redirection, MonitoredPipe& pipe)
      : Destination(std::move(redirection)), pipe_(&pipe) {}

  Result<std::size_t> write(std::string_view data) override { return pipe_->write(data); }
  void close() noexcept override {
    if (pipe_->state() == MonitoredPipe::State::open) {
      pipe_->close();
    }
  }
  [[nodiscard]] DestinationKind kind() const noexcept override {
    return DestinationKind::monitored_pipe;
  }

 private:
  MonitoredPipe* pipe_;
};

template <typename T>
const T* alternative(const Redirection& value) {
  return std::get_if<T>(&value.value);
}

bool is_fd(const Redirection& value, int fd) {
  const auto* target = alternative<Redirection::Fd>(value);
  return target != nullptr && target->fd == fd;
}

Error unsupported(const Redirection& value) {
  return Error{.code = make_error_code(errc::unsupported_redirection), .context = to_string(value)};
}

Result<DestinationPtr> open_file(const Redirection& value, DestinationKind kind) {
  const auto& spec = *alternative<Redirection::File>(value);
  int flags = internal::open_flags_for(spec.mode.value_or(OpenMode::write_truncate)) | O_CLOEXEC;
  auto perms = spec.perms.value_or(internal::kDefaultFilePerms);
  internal::unique_fd fd(::open(spec.path.c_str(), flags, static_cast<int>(perms)));
  if (!fd) {
    int saved = errno;
    return Error{.code = std::error_code(saved, std::system_category()),
                 .context = "open " + spec.path.string()};
  }
  return DestinationPtr(std::make_unique<FileDestination>(value, kind, std::move(fd)));
}

DestinationPtr marker(const Redirection& value, DestinationKind kind) {
  return std::make_unique<MarkerDestination>(value, kind);
}

struct Handler {
  DestinationKind kind;
  bool (*handles)(const Redirection&);
  Result<DestinationPtr> (*make)(const Redirection&);
};

// Resolution order. Earlier entries win where predicates overlap: descriptors 1 and 2
// resolve to the standard streams, and descriptor-backed writers resolve to `io`.
const std::array<Handler, 13> kHandlers = {{
    {DestinationKind::null_device,
     [](const Redirection& v) { return alternative<Redirection::Null>(v) != nullptr; },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return marker(v, DestinationKind::null_device);
     }},
    {DestinationKind::close,
     [](const Redirection& v) { return alternative<Redirection::Close>(v) != nullptr; },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return marker(v, DestinationKind::close);
     }},
    {DestinationKind::child_redirection,
     [](const Redirection& v) {
       const auto* child = alternative<Redirection::Child>(v);
       return child != nullptr && child->fd >= 0;
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return marker(v, DestinationKind::child_redirection);
     }},
    {DestinationKind::standard_output,
     [](const Redirection& v) {
       return alternative<Redirection::Stdout>(v) != nullptr || is_fd(v, STDOUT_FILENO);
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return DestinationPtr(std::make_unique<ForwardingDestination>(
           v, DestinationKind::standard_output, standard_output()));
     }},
    {DestinationKind::standard_error,
     [](const Redirection& v) {
       return alternative<Redirection::Stderr>(v) != nullptr || is_fd(v, STDERR_FILENO);
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return DestinationPtr(std::make_unique<ForwardingDestination>(
           v, DestinationKind::standard_error, standard_error()));
     }},
    {DestinationKind::file_descriptor,
     [](const Redirection& v) {
       const auto* target = alternative<Redirection::Fd>(v);
       return target != nullptr && target->fd >= 0;
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return DestinationPtr(
           std::make_unique<FileDescriptorDestination>(v, alternative<Redirection::Fd>(v)->fd));
     }},
    {DestinationKind::file_path_mode_perms,
     [](const Redirection& v) {
       const auto* file = alternative<Redirection::File>(v);
       return file != nullptr && file->mode.has_value() && file->perms.has_value();
     },
     [](const Redirection& v) { return open_file(v, DestinationKind::file_path_mode_perms); }},
    {DestinationKind::file_path_mode,
     [](const Redirection& v) {
       const auto* file = alternative<Redirection::File>(v);
       return file != nullptr && file->mode.has_value() && !file->perms.has_value();
     },
     [](const Redirection& v) { return open_file(v, DestinationKind::file_path_mode); }},
    {DestinationKind::file_path,
     [](const Redirection& v) {
       const auto* file = alternative<Redirection::File>(v);
       return file != nullptr && !file->mode.has_value() && !file->perms.has_value();
     },
     [](const Redirection& v) { return open_file(v, DestinationKind::file_path); }},
    {DestinationKind::tee,
     [](const Redirection& v) {
       const auto* tee = alternative<Redirection::Tee>(v);
       return tee != nullptr && !tee->targets.empty();
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       std::vector<DestinationPtr> children;
       for (const auto& target : alternative<Redirection::Tee>(v)->targets) {
         auto child = make_destination(target);
         if (!child) {
           for (auto& opened : children) {
             opened->close();
           }
           return child.error();
         }
         children.push_back(std::move(child.value()));
       }
       return DestinationPtr(std::make_unique<TeeDestination>(v, std::move(children)));
     }},
    {DestinationKind::monitored_pipe,
     [](const Redirection& v) {
       const auto* pipe = alternative<Redirection::Pipe>(v);
       return pipe != nullptr && pipe->pipe != nullptr;
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return DestinationPtr(
           std::make_unique<MonitoredPipeDestination>(v, *alternative<Redirection::Pipe>(v)->pipe));
     }},
    {DestinationKind::io,
     [](const Redirection& v) {
       const auto* sink = alternative<Redirection::Sink>(v);
       return sink != nullptr && sink->writer != nullptr &&
              sink->writer->native_handle().has_value();
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return DestinationPtr(std::make_unique<ForwardingDestination>(
           v, DestinationKind::io, *alternative<Redirection::Sink>(v)->writer));
     }},
    {DestinationKind::writer,
     [](const Redirection& v) {
       const auto* sink = alternative<Redirection::Sink>(v);
       return sink != nullptr && sink->writer != nullptr;
     },
     [](const Redirection& v) -> Result<DestinationPtr> {
       return DestinationPtr(std::make_unique<ForwardingDestination>(
           v, DestinationKind::writer, *alternative<Redirection::Sink>(v)->writer));
     }},
}};

const Handler* find_handler(const Redirection& value) {
  for (const auto& handler : kHandlers) {
    if (handler.handles(value)) {
      return &handler;
    }
  }
  return nullptr;
}

}  // namespace

const char* to_string(DestinationKind kind) noexcept {
  switch (kind) {
    case DestinationKind::null_device:
      return "null_device";
    case DestinationKind::close:
      return "close";
    case DestinationKind::child_redirection:
      return "child_redirection";
    case DestinationKind::standard_output:
      return "standard_output";
    case DestinationKind::standard_error:
      return "standard_error";
    case DestinationKind::file_descriptor:
      return "file_descriptor";
    case DestinationKind::file_path_mode_perms:
      return "file_path_mode_perms";
    case DestinationKind::file_path_mode:
      return "file_path_mode";
    case DestinationKind::file_path:
      return "file_path";
    case DestinationKind::tee:
      return "tee";
    case DestinationKind::monitored_pipe:
      return "monitored_pipe";
    case DestinationKind::io:
      return "io";
    case DestinationKind::writer:
      return "writer";
  }
  return "unknown";
}

Result<DestinationKind> resolve_destination_kind(const Redirection& value) {
  const auto* handler = find_handler(value);
  if (handler == nullptr) {
    return unsupported(value);
  }
  return handler->kind;
}

Result<std::unique_ptr<Destination>> make_destination(const Redirection& value) {
  const auto* handler = find_handler(value);
  if (handler == nullptr) {
    return unsupported(value);
  }
  return handler->make(value);
}

Result<bool> compatible_with_monitored_pipe(const Redirection& value) {
  auto kind = resolve_destination_kind(value);
  if (!kind) {
    return kind.error();
  }
  switch (*kind) {
    case DestinationKind::null_device:
    case DestinationKind::close:
    case DestinationKind::child_redirection:
      return false;
    default:
      return true;
  }
}

}  // namespace procex
