#include "app/ClientIdentity.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace twinboot::app {

ClientIdentityOptions MakeClientIdentityOptions(const core::ClientConfig& cfg,
                                                std::vector<std::string> launchArgs)
{
    ClientIdentityOptions o;
    o.signals.runningInHost = cfg.hostMode == core::HostMode::Editor;
    o.signals.useLaunchArgs = cfg.useLaunchArgs;
    o.signals.launchArgKey = cfg.launchArgKey;
    o.detectors = cfg.detectors;
    o.projectDir = cfg.projectDir;
    o.launchArgs = std::move(launchArgs);
    o.environment = cfg.environment;
    return o;
}

ClientIdentity::ClientIdentity(ClientIdentityOptions options,
                               IIdentityBackend& backend,
                               input::IPointerInputRouting& routing,
                               std::shared_ptr<spdlog::logger> logger)
    : m_log(logger ? std::move(logger) : spdlog::default_logger())
    , m_collector(options.signals, options.launchArgs, m_log)
    , m_focusGate(routing, m_secondary, m_log)
    , m_bootstrapper(backend, m_collector, m_secondary, m_log, options.environment)
{
    identity::DetectorContext ctx;
    ctx.args = options.launchArgs;
    ctx.projectDir = options.projectDir;

    for (const auto& name : options.detectors)
    {
        auto detector = identity::MakeDetector(name, ctx);
        if (!detector)
        {
            m_log->warn("[Identity] Unknown sibling detector '{}' ignored", name);
            continue;
        }
        m_collector.AddDetector(std::move(detector));
    }

    m_collector.SetSecondaryInstanceCallback([this](const std::string&) {
        m_focusGate.Engage();
    });
}

bool ClientIdentity::Authenticate()
{
    return m_bootstrapper.Bootstrap();
}

std::future<bool> ClientIdentity::AuthenticateAsync()
{
    return m_bootstrapper.BootstrapAsync();
}

bool ClientIdentity::IsAuthenticated() const
{
    return m_bootstrapper.IsAuthenticated();
}

std::optional<std::string> ClientIdentity::SessionId() const
{
    return m_bootstrapper.Session().SessionId();
}

std::string ClientIdentity::Profile() const
{
    return m_bootstrapper.Profile();
}

void ClientIdentity::OnApplicationFocus(bool focused)
{
    m_focusGate.OnApplicationFocus(focused);
}

void ClientIdentity::ProcessInput(std::span<const input::InputEvent> events)
{
    m_focusGate.Consume(events);
}

} // namespace twinboot::app
