#pragma once

#include "core/Config.h"
#include "identity/IdentityBootstrapper.h"
#include "identity/SecondaryInstanceFlag.h"
#include "identity/SignalCollector.h"
#include "input/FocusGate.h"
#include "input/InputRouting.h"

#include <twinboot/IdentityBackend.h>

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace twinboot::app {

struct ClientIdentityOptions {
    identity::SignalCollectorOptions signals;

    // Sibling detectors by name, highest priority first.
    std::vector<std::string> detectors;
    std::filesystem::path projectDir;

    // Process arguments (argv[0] excluded).
    std::vector<std::string> launchArgs;

    std::string environment = "production";
};

[[nodiscard]] ClientIdentityOptions MakeClientIdentityOptions(const core::ClientConfig& cfg,
                                                              std::vector<std::string> launchArgs);

// Per-process owner of the identity bootstrap.
//
// Holds the secondary-instance flag, the signal collector, the bootstrapper
// and the focus gate, and wires the collector's clone detection to the gate.
// Construct once at startup and keep it alive for the life of the process;
// the backend and input routing must outlive it.
class ClientIdentity {
public:
    ClientIdentity(ClientIdentityOptions options,
                   IIdentityBackend& backend,
                   input::IPointerInputRouting& routing,
                   std::shared_ptr<spdlog::logger> logger);

    ClientIdentity(const ClientIdentity&) = delete;
    ClientIdentity& operator=(const ClientIdentity&) = delete;

    // Initialize the backend (once) and make sure an anonymous session exists.
    bool Authenticate();
    [[nodiscard]] std::future<bool> AuthenticateAsync();

    [[nodiscard]] bool IsAuthenticated() const;
    [[nodiscard]] std::optional<std::string> SessionId() const;
    [[nodiscard]] std::string Profile() const;

    [[nodiscard]] bool IsSecondaryInstance() const noexcept { return m_secondary.IsSet(); }

    // Window-system focus notifications.
    void OnApplicationFocus(bool focused);
    void ProcessInput(std::span<const input::InputEvent> events);

    [[nodiscard]] const identity::IdentityBootstrapper& Bootstrapper() const noexcept { return m_bootstrapper; }
    [[nodiscard]] const identity::SignalCollector& Signals() const noexcept { return m_collector; }
    [[nodiscard]] const input::FocusGate& Gate() const noexcept { return m_focusGate; }

private:
    std::shared_ptr<spdlog::logger> m_log;
    identity::SecondaryInstanceFlag m_secondary;
    identity::SignalCollector m_collector;
    input::FocusGate m_focusGate;
    identity::IdentityBootstrapper m_bootstrapper;
};

} // namespace twinboot::app
