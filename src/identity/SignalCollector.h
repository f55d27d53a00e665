#pragma once

#include "identity/ProfileCandidate.h"
#include "identity/SecondaryInstanceFlag.h"
#include "identity/SiblingDetector.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

namespace twinboot::identity {

inline constexpr std::string_view kHostRole   = "Editor";
inline constexpr std::string_view kPlayerRole = "Player";
inline constexpr std::string_view kDefaultLaunchArgKey = "PlayerArg";

struct SignalCollectorOptions {
    // Running inside the development host (editor) rather than a built player.
    bool runningInHost = false;

    // Read `<launchArgKey>:<value>` tokens from the launch arguments (built runs only).
    bool useLaunchArgs = true;
    std::string launchArgKey = std::string(kDefaultLaunchArgKey);
};

struct CollectedSignals {
    ProfileCandidate candidate;
    bool secondaryInstance = false;
    std::string matchedDetector;   // empty when no detector matched
};

// Values of every `<key>:<value>` argument, concatenated in argument order.
// The key match is case-insensitive and ignores leading '-' or '/'; the value
// is everything after the first colon. `malformed` receives arguments that
// name the key but carry no colon.
[[nodiscard]] std::string ExtractLaunchArgValue(const std::vector<std::string>& args,
                                                std::string_view key,
                                                std::vector<std::string>* malformed = nullptr);

class SignalCollector {
public:
    SignalCollector(SignalCollectorOptions options,
                    std::vector<std::string> launchArgs,
                    std::shared_ptr<spdlog::logger> logger);

    // Detectors are queried in the order they were added.
    void AddDetector(std::unique_ptr<ISiblingDetector> detector);
    [[nodiscard]] std::size_t DetectorCount() const noexcept { return m_detectors.size(); }

    // Invoked once, the first time Collect() sets the secondary-instance flag.
    using SecondaryInstanceCallback = std::function<void(const std::string& detectorName)>;
    void SetSecondaryInstanceCallback(SecondaryInstanceCallback cb) { m_onSecondary = std::move(cb); }

    // Gathers base role, sibling label and launch-argument fragments.
    // Sets `secondaryFlag` when a detector reports a secondary instance.
    CollectedSignals Collect(SecondaryInstanceFlag& secondaryFlag) const;

    [[nodiscard]] const SignalCollectorOptions& Options() const noexcept { return m_options; }

private:
    SignalCollectorOptions m_options;
    std::vector<std::string> m_launchArgs;
    std::vector<std::unique_ptr<ISiblingDetector>> m_detectors;
    std::shared_ptr<spdlog::logger> m_log;
    SecondaryInstanceCallback m_onSecondary;
};

} // namespace twinboot::identity
