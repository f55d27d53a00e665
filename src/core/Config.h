#pragma once

#include "core/Log.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace twinboot::core {

enum class HostMode : std::uint8_t {
    Player = 0,   // built client
    Editor = 1,   // running inside the development host
};

[[nodiscard]] const char* ToString(HostMode m) noexcept;

// Client settings file (twinboot.json).
//
// Every field has a usable default so a missing file is a normal first run.
struct ClientConfig
{
    // --------------------------------------------------------------------------------------------
    // identity
    // --------------------------------------------------------------------------------------------
    HostMode hostMode = HostMode::Player;

    // Read "<launchArgKey>:<value>" tokens from the launch arguments in built runs.
    bool useLaunchArgs = true;
    std::string launchArgKey = "PlayerArg";

    // Sibling detectors, highest priority first. First positive match wins.
    std::vector<std::string> detectors = {"virtual-clone", "clone-marker"};

    // Folder the clone-marker detector inspects. Empty = current directory.
    std::filesystem::path projectDir;

    // --------------------------------------------------------------------------------------------
    // backend
    // --------------------------------------------------------------------------------------------
    std::filesystem::path storeDir;        // empty = paths::SessionStoreDir()
    std::string environment = "production";
    int latencyMs = 0;

    // --------------------------------------------------------------------------------------------
    // logging
    // --------------------------------------------------------------------------------------------
    LoggingConfig logging;
};

inline constexpr int kClientConfigSchemaVersion = 1;
inline constexpr int kMaxLatencyMs = 10000;

// Returns true if the file existed and was parsed. On failure `out` is left
// unchanged (callers start from defaults). Individual bad values keep the
// value already in `out`.
[[nodiscard]] bool LoadClientConfig(const std::filesystem::path& path, ClientConfig& out) noexcept;

// Returns true on success.
[[nodiscard]] bool SaveClientConfig(const std::filesystem::path& path, const ClientConfig& cfg) noexcept;

} // namespace twinboot::core
