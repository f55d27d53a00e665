#include "identity/SignalCollector.h"

#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

namespace twinboot::identity {

namespace {

[[nodiscard]] bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

[[nodiscard]] std::string_view StripSwitchPrefix(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == '-' || s.front() == '/'))
        s.remove_prefix(1);
    return s;
}

} // namespace

std::string ExtractLaunchArgValue(const std::vector<std::string>& args,
                                  std::string_view key,
                                  std::vector<std::string>* malformed)
{
    std::string value;
    if (key.empty())
        return value;

    for (const auto& raw : args)
    {
        const std::string_view arg(raw);
        const std::size_t colon = arg.find(':');

        if (colon == std::string_view::npos)
        {
            if (malformed && EqualsI(StripSwitchPrefix(arg), key))
                malformed->push_back(raw);
            continue;
        }

        if (!EqualsI(StripSwitchPrefix(arg.substr(0, colon)), key))
            continue;

        value.append(arg.substr(colon + 1));
    }
    return value;
}

SignalCollector::SignalCollector(SignalCollectorOptions options,
                                 std::vector<std::string> launchArgs,
                                 std::shared_ptr<spdlog::logger> logger)
    : m_options(std::move(options))
    , m_launchArgs(std::move(launchArgs))
    , m_log(logger ? std::move(logger) : spdlog::default_logger())
{
}

void SignalCollector::AddDetector(std::unique_ptr<ISiblingDetector> detector)
{
    if (detector)
        m_detectors.push_back(std::move(detector));
}

CollectedSignals SignalCollector::Collect(SecondaryInstanceFlag& secondaryFlag) const
{
    CollectedSignals out;
    out.candidate = ProfileCandidate(std::string(m_options.runningInHost ? kHostRole : kPlayerRole));

    // Clone tooling only exists inside the development host.
    if (m_options.runningInHost)
    {
        for (const auto& detector : m_detectors)
        {
            if (!detector->IsSecondaryInstance())
                continue;

            std::string label = detector->Label();
            m_log->info("[Signals] Secondary instance detected by '{}' (label '{}')", detector->Name(), label);

            if (label.empty())
            {
                m_log->warn("[Signals] A '{}' secondary instance was detected, but no instance label was set. "
                            "This may cause authentication failures when several clones connect.",
                            detector->Name());
            }

            out.candidate.Append(FragmentSource::SiblingLabel, std::move(label));
            out.secondaryInstance = true;
            out.matchedDetector = detector->Name();
            if (secondaryFlag.Set() && m_onSecondary)
                m_onSecondary(out.matchedDetector);
            break;
        }
    }

    if (!m_options.runningInHost && m_options.useLaunchArgs)
    {
        std::vector<std::string> malformed;
        std::string value = ExtractLaunchArgValue(m_launchArgs, m_options.launchArgKey, &malformed);

        for (const auto& bad : malformed)
            m_log->warn("[Signals] Ignoring launch argument '{}': expected {}:<value>", bad, m_options.launchArgKey);

        if (!value.empty())
            out.candidate.Append(FragmentSource::LaunchArgument, std::move(value));
    }

    m_log->debug("[Signals] Collected {} fragment(s), secondary={}", out.candidate.Fragments().size(), out.secondaryInstance);
    return out;
}

} // namespace twinboot::identity
