#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace twinboot::core {

struct LoggingConfig {
    std::filesystem::path directory;   // empty = console only
    std::string level = "info";        // trace|debug|info|warn|error|critical|off
    bool async = false;                // spdlog thread pool, drops oldest on overflow
    bool console = true;               // colored stdout sink
};

inline constexpr const char* kLoggerName = "twinboot";

// Creates the process logger and installs it as the spdlog default logger.
// Safe to call more than once; the previous logger is replaced.
std::shared_ptr<spdlog::logger> InitLogging(const LoggingConfig& cfg);

// Flushes and drops every registered logger.
void ShutdownLogging() noexcept;

// The process logger if InitLogging ran, otherwise the spdlog default logger.
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

// Maps a config/CLI string to a level. Unknown strings leave `out` untouched.
bool ParseLogLevel(std::string_view text, spdlog::level::level_enum& out) noexcept;

} // namespace twinboot::core
