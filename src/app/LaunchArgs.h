#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace twinboot::app {

// Parsed command line for the twinboot executable.
//
// Notes:
//   - Option names are case-insensitive.
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
//   - Tokens we do not recognize are NOT errors: clone tooling and the
//     PlayerArg:<value> source put their own tokens on the command line.
//     They are kept in `passthrough` and the full vector in `raw`.
struct LaunchArgs
{
    bool showHelp = false;                        // --help / -h / -?

    std::optional<std::filesystem::path> configPath;  // --config <path>
    std::optional<std::filesystem::path> logDir;      // --log-dir <path>
    std::optional<std::string> logLevel;              // --log-level <level>
    std::optional<std::filesystem::path> storeDir;    // --store-dir <path>
    std::optional<std::filesystem::path> projectDir;  // --project-dir <path>

    std::optional<bool> editorMode;     // --editor / --player
    std::optional<bool> useLaunchArgs;  // --player-arg / --no-player-arg

    std::optional<std::vector<std::string>> detectors;  // --detectors a,b,c

    // Every argument after argv[0], untouched.
    std::vector<std::string> raw;

    // Arguments that are not ours, in order.
    std::vector<std::string> passthrough;

    // Value options with a missing or empty value.
    std::vector<std::string> errors;
};

// Parse argv (argv[0] is skipped).
[[nodiscard]] LaunchArgs ParseLaunchArgs(int argc, char** argv);

// Test/tool entry point: same rules, argv[0] included and skipped.
[[nodiscard]] LaunchArgs ParseLaunchArgsFromArgv(std::span<const std::string_view> argv);

// Human-readable help text.
[[nodiscard]] std::string BuildLaunchHelpText();

} // namespace twinboot::app
