// src/core/Paths.h
#pragma once
#include <filesystem>

namespace twinboot::paths {
    // Per-user roots, created on demand by callers (not here).
    //   Linux/macOS: $XDG_CONFIG_HOME/twinboot, $XDG_DATA_HOME/twinboot (HOME fallbacks)
    //   Windows:     %LOCALAPPDATA%\twinboot for both
    std::filesystem::path ConfigDir();
    std::filesystem::path DataDir();

    std::filesystem::path LogsDir();          // DataDir()/logs
    std::filesystem::path SessionStoreDir();  // DataDir()/sessions
    std::filesystem::path DefaultConfigFile(); // ConfigDir()/twinboot.json
}
