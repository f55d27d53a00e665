// tests/test_signal_collector.cpp
//
// Goals:
//  - Launch-argument extraction: key match, concatenation, malformed tokens.
//  - Host mode consults sibling detectors in order; first match wins.
//  - Player mode reads launch arguments and ignores detectors.
//  - The secondary-instance flag and callback fire exactly once.

#include <doctest/doctest.h>

#include "identity/SignalCollector.h"
#include "test_support/TestLogging.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace twinboot::identity;
using twinboot::test::MakeCapturedLog;

namespace {

class ScriptedDetector final : public ISiblingDetector {
public:
    ScriptedDetector(std::string name, bool secondary, std::string label, int* queries = nullptr)
        : m_name(std::move(name)), m_secondary(secondary), m_label(std::move(label)), m_queries(queries) {}

    std::string Name() const override { return m_name; }
    bool IsSecondaryInstance() const override
    {
        if (m_queries) ++*m_queries;
        return m_secondary;
    }
    std::string Label() const override { return m_label; }

private:
    std::string m_name;
    bool m_secondary;
    std::string m_label;
    int* m_queries;
};

SignalCollectorOptions HostOptions()
{
    SignalCollectorOptions o;
    o.runningInHost = true;
    return o;
}

} // namespace

// --- ExtractLaunchArgValue -------------------------------------------------------

TEST_CASE("ExtractLaunchArgValue: single key:value token")
{
    const std::vector<std::string> args{"-name", "Foo", "PlayerArg:7"};
    CHECK(ExtractLaunchArgValue(args, "PlayerArg") == "7");
}

TEST_CASE("ExtractLaunchArgValue: several tokens concatenate in argument order")
{
    const std::vector<std::string> args{"PlayerArg:A", "other", "PlayerArg:B"};
    CHECK(ExtractLaunchArgValue(args, "PlayerArg") == "AB");
}

TEST_CASE("ExtractLaunchArgValue: key match is case-insensitive and ignores switch prefixes")
{
    CHECK(ExtractLaunchArgValue({"playerarg:1"}, "PlayerArg") == "1");
    CHECK(ExtractLaunchArgValue({"-PlayerArg:2"}, "PlayerArg") == "2");
    CHECK(ExtractLaunchArgValue({"--PLAYERARG:3"}, "PlayerArg") == "3");
    CHECK(ExtractLaunchArgValue({"/PlayerArg:4"}, "PlayerArg") == "4");
}

TEST_CASE("ExtractLaunchArgValue: value is everything after the first colon")
{
    CHECK(ExtractLaunchArgValue({"PlayerArg:a:b"}, "PlayerArg") == "a:b");
    CHECK(ExtractLaunchArgValue({"PlayerArg:"}, "PlayerArg") == "");
}

TEST_CASE("ExtractLaunchArgValue: tokens that merely contain the key do not match")
{
    const std::vector<std::string> args{"MyPlayerArg:1", "PlayerArgs:2", "x=PlayerArg:3"};
    CHECK(ExtractLaunchArgValue(args, "PlayerArg") == "");
}

TEST_CASE("ExtractLaunchArgValue: key without colon is reported as malformed")
{
    std::vector<std::string> malformed;
    const std::vector<std::string> args{"PlayerArg", "--playerarg", "PlayerArg:9"};

    CHECK(ExtractLaunchArgValue(args, "PlayerArg", &malformed) == "9");
    REQUIRE(malformed.size() == 2);
    CHECK(malformed[0] == "PlayerArg");
    CHECK(malformed[1] == "--playerarg");
}

TEST_CASE("ExtractLaunchArgValue: empty key never matches")
{
    CHECK(ExtractLaunchArgValue({":x", "a:b"}, "") == "");
}

// --- SignalCollector: host mode --------------------------------------------------

TEST_CASE("Host mode with no detectors composes just the host role")
{
    auto log = MakeCapturedLog();
    SignalCollector c(HostOptions(), {"PlayerArg:7"}, log.logger);
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "Editor");
    CHECK_FALSE(s.secondaryInstance);
    CHECK_FALSE(flag.IsSet());
}

TEST_CASE("Host mode: a positive detector contributes its label and sets the flag")
{
    auto log = MakeCapturedLog();
    SignalCollector c(HostOptions(), {}, log.logger);
    c.AddDetector(std::make_unique<ScriptedDetector>("virtual-clone", true, "Clone1"));
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "EditorClone1");
    CHECK(s.secondaryInstance);
    CHECK(s.matchedDetector == "virtual-clone");
    CHECK(flag.IsSet());
    CHECK(log.Contains("Secondary instance detected by 'virtual-clone'"));
}

TEST_CASE("Host mode: first positive detector wins, later detectors are not queried")
{
    auto log = MakeCapturedLog();
    int firstQueries = 0, secondQueries = 0, thirdQueries = 0;

    SignalCollector c(HostOptions(), {}, log.logger);
    c.AddDetector(std::make_unique<ScriptedDetector>("a", false, "ignored", &firstQueries));
    c.AddDetector(std::make_unique<ScriptedDetector>("b", true, "B", &secondQueries));
    c.AddDetector(std::make_unique<ScriptedDetector>("c", true, "C", &thirdQueries));
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "EditorB");
    CHECK(s.matchedDetector == "b");
    CHECK(firstQueries == 1);
    CHECK(secondQueries == 1);
    CHECK(thirdQueries == 0);
}

TEST_CASE("Host mode: detected clone with an empty label warns and still marks secondary")
{
    auto log = MakeCapturedLog();
    SignalCollector c(HostOptions(), {}, log.logger);
    c.AddDetector(std::make_unique<ScriptedDetector>("clone-marker", true, ""));
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "Editor");
    CHECK(s.secondaryInstance);
    CHECK(flag.IsSet());
    CHECK(log.Count("[warning]") == 1);
    CHECK(log.Contains("no instance label was set"));
}

TEST_CASE("Host mode ignores launch arguments")
{
    auto log = MakeCapturedLog();
    SignalCollector c(HostOptions(), {"PlayerArg:42"}, log.logger);
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK_FALSE(s.candidate.HasSource(FragmentSource::LaunchArgument));
}

TEST_CASE("Secondary-instance callback fires once across repeated collections")
{
    auto log = MakeCapturedLog();
    SignalCollector c(HostOptions(), {}, log.logger);
    c.AddDetector(std::make_unique<ScriptedDetector>("virtual-clone", true, "X"));

    int fired = 0;
    std::string seen;
    c.SetSecondaryInstanceCallback([&](const std::string& name) { ++fired; seen = name; });

    SecondaryInstanceFlag flag;
    (void)c.Collect(flag);
    (void)c.Collect(flag);

    CHECK(fired == 1);
    CHECK(seen == "virtual-clone");
    CHECK(flag.IsSet());
}

TEST_CASE("AddDetector ignores null detectors")
{
    SignalCollector c(HostOptions(), {}, nullptr);
    c.AddDetector(nullptr);
    CHECK(c.DetectorCount() == 0);
}

// --- SignalCollector: player mode ------------------------------------------------

TEST_CASE("Player mode appends the launch-argument value")
{
    auto log = MakeCapturedLog();
    SignalCollector c(SignalCollectorOptions{}, {"-name", "Foo", "PlayerArg:7"}, log.logger);
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "Player7");
}

TEST_CASE("Player mode never consults sibling detectors")
{
    auto log = MakeCapturedLog();
    int queries = 0;
    SignalCollector c(SignalCollectorOptions{}, {}, log.logger);
    c.AddDetector(std::make_unique<ScriptedDetector>("virtual-clone", true, "Clone1", &queries));
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "Player");
    CHECK(queries == 0);
    CHECK_FALSE(flag.IsSet());
}

TEST_CASE("Player mode with launch arguments disabled composes just the role")
{
    SignalCollectorOptions o;
    o.useLaunchArgs = false;
    SignalCollector c(o, {"PlayerArg:7"}, nullptr);
    SecondaryInstanceFlag flag;

    CHECK(ComposeProfile(c.Collect(flag).candidate) == "Player");
}

TEST_CASE("Player mode honours a custom launch-argument key")
{
    SignalCollectorOptions o;
    o.launchArgKey = "Seat";
    SignalCollector c(o, {"PlayerArg:7", "seat:3"}, nullptr);
    SecondaryInstanceFlag flag;

    CHECK(ComposeProfile(c.Collect(flag).candidate) == "Player3");
}

TEST_CASE("Player mode warns about key tokens without a value separator")
{
    auto log = MakeCapturedLog();
    SignalCollector c(SignalCollectorOptions{}, {"PlayerArg"}, log.logger);
    SecondaryInstanceFlag flag;

    const auto s = c.Collect(flag);
    CHECK(ComposeProfile(s.candidate) == "Player");
    CHECK(log.Contains("Ignoring launch argument 'PlayerArg'"));
}
