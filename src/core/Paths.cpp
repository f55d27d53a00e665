// src/core/Paths.cpp
#include "core/Paths.h"

#include <cstdlib>
#include <string>
#include <system_error>

namespace {
  const char* kVendor = "twinboot";

  std::filesystem::path EnvPath(const char* name) {
    const char* v = std::getenv(name);
    if (v && v[0] != '\0')
      return std::filesystem::path(v);
    return {};
  }

  std::filesystem::path FallbackRoot() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path(".") : tmp;
  }

  // base/<vendor>, where base comes from `xdgVar` or $HOME/<homeSuffix>.
  std::filesystem::path UserRoot(const char* xdgVar, const char* homeSuffix) {
#if defined(_WIN32)
    (void)xdgVar; (void)homeSuffix;
    if (auto p = EnvPath("LOCALAPPDATA"); !p.empty())
      return p / kVendor;
    return FallbackRoot() / kVendor;
#else
    if (auto p = EnvPath(xdgVar); !p.empty())
      return p / kVendor;
    if (auto home = EnvPath("HOME"); !home.empty())
      return home / homeSuffix / kVendor;
    return FallbackRoot() / kVendor;
#endif
  }
}

namespace twinboot::paths {
  std::filesystem::path ConfigDir()         { return UserRoot("XDG_CONFIG_HOME", ".config"); }
  std::filesystem::path DataDir()           { return UserRoot("XDG_DATA_HOME", ".local/share"); }
  std::filesystem::path LogsDir()           { return DataDir() / "logs"; }
  std::filesystem::path SessionStoreDir()   { return DataDir() / "sessions"; }
  std::filesystem::path DefaultConfigFile() { return ConfigDir() / "twinboot.json"; }
}
