#include "identity/IdentityBootstrapper.h"

#include "identity/ProfileSanitizer.h"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace twinboot::identity {

namespace {

// Which step of the attempt was running when an error surfaced.
enum class Phase { Compose, Initialize, SignIn, Finish };

BootstrapFailure Classify(Phase phase, const BackendError& e) noexcept
{
    if (e.code() == BackendErrorCode::InvalidProfile)
        return BootstrapFailure::MalformedProfile;
    if (e.code() == BackendErrorCode::Unavailable)
        return BootstrapFailure::BackendUnavailable;

    switch (phase)
    {
    case Phase::Compose:
    case Phase::Initialize: return BootstrapFailure::InitializeFailed;
    case Phase::SignIn:
    case Phase::Finish:     return BootstrapFailure::SignInFailed;
    }
    return BootstrapFailure::Unexpected;
}

const char* PhaseName(Phase phase) noexcept
{
    switch (phase)
    {
    case Phase::Compose:    return "profile composition";
    case Phase::Initialize: return "backend initialization";
    case Phase::SignIn:     return "anonymous sign-in";
    case Phase::Finish:     return "session caching";
    }
    return "bootstrap";
}

// Carries a classified failure out of the attempt body.
struct AttemptFailure {
    BootstrapFailure failure;
    std::string message;
};

} // namespace

IdentityBootstrapper::IdentityBootstrapper(IIdentityBackend& backend,
                                           const SignalCollector& collector,
                                           SecondaryInstanceFlag& secondaryFlag,
                                           std::shared_ptr<spdlog::logger> logger,
                                           std::string environment)
    : m_backend(backend)
    , m_collector(collector)
    , m_secondaryFlag(secondaryFlag)
    , m_log(logger ? std::move(logger) : spdlog::default_logger())
    , m_environment(std::move(environment))
{
}

bool IdentityBootstrapper::Bootstrap()
{
    std::lock_guard attempt(m_attemptMutex);

    m_state.store(BootstrapState::Initializing, std::memory_order_release);

    BootstrapResult result = RunAttempt();
    const bool ok = result.ok();

    {
        std::lock_guard lk(m_resultMutex);
        m_lastResult = std::move(result);
    }

    if (!ok)
        m_session.Clear();

    m_state.store(ok ? BootstrapState::Initialized : BootstrapState::Failed, std::memory_order_release);
    return ok;
}

std::future<bool> IdentityBootstrapper::BootstrapAsync()
{
    return std::async(std::launch::async, [this] { return Bootstrap(); });
}

BootstrapResult IdentityBootstrapper::RunAttempt()
{
    BootstrapResult result;
    Phase phase = Phase::Compose;

    try {
        if (!m_backend.IsInitialized())
        {
            const std::string profile = ComposeBackendProfile();
            phase = Phase::Initialize;
            InitializeBackend(profile, result);
        }
        else
        {
            m_log->debug("[Identity] Backend already initialized; skipping initialization");
        }

        phase = Phase::SignIn;
        EnsureSignedIn(result);

        phase = Phase::Finish;
        std::string sessionId = m_backend.CurrentSessionId();
        if (sessionId.empty())
            throw AttemptFailure{BootstrapFailure::SignInFailed, "backend reported an empty session id after sign-in"};
        if (!m_backend.IsInitialized())
            throw AttemptFailure{BootstrapFailure::InitializeFailed, "backend is not initialized after bootstrap"};

        m_log->info("[Identity] Signed in (profile '{}', session '{}')", Profile(), sessionId);
        m_session.Store(std::move(sessionId));
        result.profile = Profile();
        return result;
    }
    catch (const AttemptFailure& f) {
        result.failure = f.failure;
        result.message = f.message;
    }
    catch (const BackendError& e) {
        result.failure = Classify(phase, e);
        result.message = std::string(ToString(e.code())) + ": " + e.what();
    }
    catch (const std::exception& e) {
        result.failure = (phase == Phase::Compose || phase == Phase::Initialize)
                             ? BootstrapFailure::InitializeFailed
                             : BootstrapFailure::SignInFailed;
        result.message = e.what();
    }
    catch (...) {
        result.failure = BootstrapFailure::Unexpected;
        result.message = "non-standard exception";
    }

    if (result.profile.empty())
        result.profile = Profile();

    m_log->error("[Identity] Error during authentication ({}, during {}): {}",
                 ToString(result.failure), PhaseName(phase), result.message);
    return result;
}

std::string IdentityBootstrapper::ComposeBackendProfile()
{
    const CollectedSignals signals = m_collector.Collect(m_secondaryFlag);
    const std::string raw = ComposeProfile(signals.candidate);
    std::string profile = SanitizeProfile(raw);

    if (profile.empty())
        throw AttemptFailure{BootstrapFailure::MalformedProfile,
                             "profile '" + raw + "' is empty after sanitization"};

    if (profile != raw)
        m_log->debug("[Identity] Sanitized profile '{}' -> '{}'", raw, profile);

    {
        std::lock_guard lk(m_resultMutex);
        m_profile = profile;
    }

    return profile;
}

void IdentityBootstrapper::InitializeBackend(const std::string& profile, BootstrapResult& result)
{
    m_log->info("[Identity] Signing in with profile {}", profile);

    InitializationOptions options;
    options.profile = profile;
    options.environment = m_environment;

    // Another owner may initialize the shared backend after the
    // IsInitialized() check; either call can report it.
    try {
        m_backend.ConfigureProfile(profile);
        m_backend.Initialize(options).get();
        result.initializedNow = true;
    }
    catch (const BackendError& e) {
        if (e.code() != BackendErrorCode::AlreadyInitialized)
            throw;
        m_log->info("[Identity] Backend reported it was already initialized; continuing");
    }
}

void IdentityBootstrapper::EnsureSignedIn(BootstrapResult& result)
{
    if (m_backend.IsSignedIn())
    {
        m_log->debug("[Identity] Session already present; skipping sign-in");
        return;
    }

    m_backend.SignInAnonymously().get();
    result.signedInNow = true;
}

bool IdentityBootstrapper::IsAuthenticated() const
{
    try {
        return m_backend.IsSignedIn();
    }
    catch (const BackendError& e) {
        m_log->debug("[Identity] Session query before backend was ready ({}): {}", ToString(e.code()), e.what());
    }
    catch (const std::exception& e) {
        m_log->warn("[Identity] Session query failed: {}", e.what());
    }
    return false;
}

BootstrapResult IdentityBootstrapper::LastResult() const
{
    std::lock_guard lk(m_resultMutex);
    return m_lastResult;
}

std::string IdentityBootstrapper::Profile() const
{
    std::lock_guard lk(m_resultMutex);
    return m_profile;
}

} // namespace twinboot::identity
