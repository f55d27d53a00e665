// src/app/main.cpp
//
// twinboot: derive this instance's profile, bootstrap the identity backend and
// print the resulting session.
//
// Exit codes: 0 signed in, 1 bootstrap failed, 2 usage error.

#include "app/ClientIdentity.h"
#include "app/LaunchArgs.h"
#include "backend/LocalIdentityBackend.h"
#include "core/Config.h"
#include "core/Log.h"
#include "core/Paths.h"
#include "input/InputRouting.h"

#include <chrono>
#include <cstdio>
#include <string>

#include <spdlog/spdlog.h>

namespace {

using namespace twinboot;

void ApplyOverrides(const app::LaunchArgs& args, core::ClientConfig& cfg)
{
    if (args.logDir)        cfg.logging.directory = *args.logDir;
    if (args.logLevel)      cfg.logging.level = *args.logLevel;
    if (args.storeDir)      cfg.storeDir = *args.storeDir;
    if (args.projectDir)    cfg.projectDir = *args.projectDir;
    if (args.editorMode)    cfg.hostMode = *args.editorMode ? core::HostMode::Editor : core::HostMode::Player;
    if (args.useLaunchArgs) cfg.useLaunchArgs = *args.useLaunchArgs;
    if (args.detectors)     cfg.detectors = *args.detectors;
}

} // namespace

int main(int argc, char** argv)
{
    const app::LaunchArgs args = app::ParseLaunchArgs(argc, argv);

    if (args.showHelp)
    {
        std::fputs(app::BuildLaunchHelpText().c_str(), stdout);
        return 0;
    }

    if (!args.errors.empty())
    {
        for (const auto& e : args.errors)
            std::fprintf(stderr, "twinboot: option '%s' needs a value\n", e.c_str());
        std::fputs("Run 'twinboot --help' for usage.\n", stderr);
        return 2;
    }

    core::ClientConfig cfg;
    cfg.logging.directory = paths::LogsDir();

    const auto configPath = args.configPath.value_or(paths::DefaultConfigFile());
    const bool loadedConfig = core::LoadClientConfig(configPath, cfg);
    ApplyOverrides(args, cfg);

    if (cfg.storeDir.empty())
        cfg.storeDir = paths::SessionStoreDir();

    auto log = core::InitLogging(cfg.logging);
    log->info("Config: {} ({})", configPath.string(), loadedConfig ? "loaded" : "defaults");
    log->info("Mode: {}, launch-arg source: {}, detectors: {}",
              core::ToString(cfg.hostMode),
              cfg.useLaunchArgs ? cfg.launchArgKey : std::string("off"),
              cfg.detectors.size());

    int exitCode = 1;
    {
        backend::LocalBackendOptions backendOptions;
        backendOptions.storeDir = cfg.storeDir;
        backendOptions.latency = std::chrono::milliseconds(cfg.latencyMs);
        backend::LocalIdentityBackend identityBackend(backendOptions, log);

        input::InputRoutingSwitch routing;
        app::ClientIdentity client(app::MakeClientIdentityOptions(cfg, args.passthrough), identityBackend, routing, log);

        if (client.Authenticate())
        {
            std::printf("profile=%s session=%s secondary=%s\n",
                        client.Profile().c_str(),
                        client.SessionId().value_or("").c_str(),
                        client.IsSecondaryInstance() ? "yes" : "no");
            exitCode = 0;
        }
        else
        {
            const auto result = client.Bootstrapper().LastResult();
            std::fprintf(stderr, "twinboot: authentication failed (%s): %s\n",
                         identity::ToString(result.failure), result.message.c_str());
        }
    }

    core::ShutdownLogging();
    return exitCode;
}
