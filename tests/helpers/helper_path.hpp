#pragma once

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace procex::support {

namespace fs = std::filesystem;

// Location of the procex_child helper binary. PROCEX_HELPER_PATH in the
// environment wins over the path baked in at build time.
inline std::string helper_path() {
  const char* override_path = std::getenv("PROCEX_HELPER_PATH");
  if (override_path && fs::exists(override_path)) {
    return override_path;
  }

#ifdef PROCEX_HELPER_PATH
  if (fs::exists(PROCEX_HELPER_PATH)) {
    return PROCEX_HELPER_PATH;
  }
#endif

  std::cerr << "helper path not found\n";
  return "";
}

}  // namespace procex::support
