#pragma once

#include "identity/BootstrapState.h"
#include "identity/SessionCache.h"
#include "identity/SignalCollector.h"

#include <twinboot/IdentityBackend.h>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/logger.h>

namespace twinboot::identity {

// Drives the one-time backend initialization under the composed, sanitized
// profile, then makes sure an anonymous session exists.
//
// Errors never leave Bootstrap(): every failure is logged with its context,
// recorded in LastResult() and reported as `false`. No internal retries; the
// caller decides whether to call Bootstrap() again.
//
// Bootstrap() holds a mutex for the whole attempt, so concurrent callers are
// serialized and cannot race the Uninitialized -> Initializing transition.
class IdentityBootstrapper {
public:
    IdentityBootstrapper(IIdentityBackend& backend,
                         const SignalCollector& collector,
                         SecondaryInstanceFlag& secondaryFlag,
                         std::shared_ptr<spdlog::logger> logger,
                         std::string environment = "production");

    IdentityBootstrapper(const IdentityBootstrapper&) = delete;
    IdentityBootstrapper& operator=(const IdentityBootstrapper&) = delete;

    bool Bootstrap();

    // Runs Bootstrap() on a background thread. The bootstrapper must outlive
    // the returned future.
    [[nodiscard]] std::future<bool> BootstrapAsync();

    // Whether the backend currently holds a session. A backend that is not
    // initialized yet (or fails to answer) reads as false.
    [[nodiscard]] bool IsAuthenticated() const;

    [[nodiscard]] BootstrapState State() const noexcept { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] BootstrapResult LastResult() const;
    [[nodiscard]] const SessionCache& Session() const noexcept { return m_session; }

    // Last profile handed to the backend (sanitized); empty before the first
    // initialization.
    [[nodiscard]] std::string Profile() const;

private:
    BootstrapResult RunAttempt();
    std::string ComposeBackendProfile();
    void InitializeBackend(const std::string& profile, BootstrapResult& result);
    void EnsureSignedIn(BootstrapResult& result);

    IIdentityBackend& m_backend;
    const SignalCollector& m_collector;
    SecondaryInstanceFlag& m_secondaryFlag;
    std::shared_ptr<spdlog::logger> m_log;
    std::string m_environment;

    std::mutex m_attemptMutex;
    std::atomic<BootstrapState> m_state{BootstrapState::Uninitialized};

    mutable std::mutex m_resultMutex;
    BootstrapResult m_lastResult;
    std::string m_profile;

    SessionCache m_session;
};

} // namespace twinboot::identity
