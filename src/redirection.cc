#include "procex/redirection.hpp"

#include <cstdio>
#include <string>
#include <type_traits>

namespace procex {

namespace {

const char* to_string(OpenMode mode) {
  switch (mode) {
    case OpenMode::read:
      return "read";
    case OpenMode::write_truncate:
      return "write_truncate";
    case OpenMode::write_append:
      return "write_append";
    case OpenMode::read_write:
      return "read_write";
  }
  return "unknown";
}

std::string octal(FilePerms perms) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "0%o", static_cast<unsigned>(perms));
  return buffer;
}

}  // namespace

Redirection Redirection::tee(std::vector<Redirection> targets) {
  return Redirection{Tee{std::move(targets)}};
}

Redirection Redirection::tee(std::initializer_list<Redirection> targets) {
  return Redirection{Tee{std::vector<Redirection>(targets)}};
}

std::string to_string(const Redirection& redirection) {
  return std::visit(
      [](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Redirection::Null>) {
          return "null";
        } else if constexpr (std::is_same_v<T, Redirection::Close>) {
          return "close";
        } else if constexpr (std::is_same_v<T, Redirection::Child>) {
          return "child(" + std::to_string(value.fd) + ")";
        } else if constexpr (std::is_same_v<T, Redirection::Stdout>) {
          return "stdout";
        } else if constexpr (std::is_same_v<T, Redirection::Stderr>) {
          return "stderr";
        } else if constexpr (std::is_same_v<T, Redirection::Fd>) {
          return "fd(" + std::to_string(value.fd) + ")";
        } else if constexpr (std::is_same_v<T, Redirection::File>) {
          std::string out = "file(\"" + value.path.string() + "\"";
          if (value.mode) {
            out += ", ";
            out += to_string(*value.mode);
          }
          if (value.perms) {
            out += ", " + octal(*value.perms);
          }
          out += ")";
          return out;
        } else if constexpr (std::is_same_v<T, Redirection::Sink>) {
          return value.writer != nullptr ? "writer" : "writer(null)";
        } else if constexpr (std::is_same_v<T, Redirection::Pipe>) {
          return value.pipe != nullptr ? "monitored_pipe" : "monitored_pipe(null)";
        } else {
          std::string out = "tee(";
          for (std::size_t i = 0; i < value.targets.size(); ++i) {
            if (i > 0) {
              out += ", ";
            }
            out += to_string(value.targets[i]);
          }
          out += ")";
          return out;
        }
      },
      redirection.value);
}

}  // namespace procex
