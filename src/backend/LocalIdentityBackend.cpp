#include "backend/LocalIdentityBackend.h"

#include "identity/ProfileSanitizer.h"

#include <random>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace twinboot::backend {

namespace {

std::int64_t NowUnixMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// 28 characters, same shape as hosted anonymous player ids.
std::string MintPlayerId()
{
    static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr std::size_t kLength = 28;

    std::random_device rd;
    std::mt19937_64 rng((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string id;
    id.reserve(kLength);
    for (std::size_t i = 0; i < kLength; ++i)
        id.push_back(kAlphabet[pick(rng)]);
    return id;
}

} // namespace

void ValidateProfile(const std::string& profile)
{
    if (profile.size() > LocalIdentityBackend::kMaxProfileLength)
    {
        throw BackendError(BackendErrorCode::InvalidProfile,
                           "profile '" + profile + "' is longer than " +
                           std::to_string(LocalIdentityBackend::kMaxProfileLength) + " characters");
    }
    if (!identity::IsSanitizedProfile(profile))
    {
        throw BackendError(BackendErrorCode::InvalidProfile,
                           "profile '" + profile + "' may only contain [A-Za-z0-9_-]");
    }
}

LocalIdentityBackend::LocalIdentityBackend(LocalBackendOptions options, std::shared_ptr<spdlog::logger> logger)
    : m_options(std::move(options))
    , m_log(logger ? std::move(logger) : spdlog::default_logger())
{
}

LocalIdentityBackend::~LocalIdentityBackend()
{
    m_worker.Shutdown();
}

void LocalIdentityBackend::ConfigureProfile(const std::string& profile)
{
    ValidateProfile(profile);

    std::lock_guard lk(m_mutex);
    if (m_initialized)
        throw BackendError(BackendErrorCode::AlreadyInitialized, "profile cannot change after initialization");
    m_stagedProfile = profile.empty() ? std::string(kDefaultProfile) : profile;
}

std::future<void> LocalIdentityBackend::Initialize(const InitializationOptions& options)
{
    return m_worker.Submit([this, options] { DoInitialize(options); });
}

void LocalIdentityBackend::DoInitialize(InitializationOptions options)
{
    SimulateLatency();

    std::string profile;
    {
        std::lock_guard lk(m_mutex);
        if (m_initialized || m_initializing)
            throw BackendError(BackendErrorCode::AlreadyInitialized, "identity backend is already initialized");

        if (!options.profile.empty())
        {
            ValidateProfile(options.profile);
            profile = options.profile;
        }
        else
        {
            profile = m_stagedProfile.empty() ? std::string(kDefaultProfile) : m_stagedProfile;
        }
        m_initializing = true;
    }

    // Runs without the lock; m_initializing keeps a second Initialize() out.
    std::error_code ec;
    std::filesystem::create_directories(m_options.storeDir / profile, ec);
    if (ec)
    {
        std::lock_guard lk(m_mutex);
        m_initializing = false;
        throw BackendError(BackendErrorCode::Unavailable,
                           "cannot create session store " + (m_options.storeDir / profile).string() + ": " + ec.message());
    }

    SessionRecord record;
    std::string err;
    const bool hasRecord = LoadSessionRecord(SessionRecordPath(m_options.storeDir, profile), record, &err);
    if (!hasRecord && !err.empty())
        m_log->warn("[Backend] Ignoring unreadable session record for '{}': {}", profile, err);

    std::lock_guard lk(m_mutex);
    m_profile = profile;
    m_environment = options.environment;
    m_record = std::move(record);
    m_hasRecord = hasRecord;
    m_initializing = false;
    m_initialized = true;
    m_log->info("[Backend] Initialized (profile '{}', environment '{}', stored identity: {})",
                m_profile, m_environment, m_hasRecord ? "yes" : "no");
}

bool LocalIdentityBackend::IsInitialized() const
{
    std::lock_guard lk(m_mutex);
    return m_initialized;
}

bool LocalIdentityBackend::IsSignedIn() const
{
    std::lock_guard lk(m_mutex);
    RequireInitialized("IsSignedIn");
    return m_signedIn;
}

std::future<void> LocalIdentityBackend::SignInAnonymously()
{
    return m_worker.Submit([this] { DoSignIn(); });
}

void LocalIdentityBackend::DoSignIn()
{
    SimulateLatency();

    std::lock_guard lk(m_mutex);
    RequireInitialized("SignInAnonymously");
    if (m_signedIn)
        return;

    SessionRecord updated = m_record;
    const std::int64_t now = NowUnixMs();
    if (!m_hasRecord)
    {
        updated = SessionRecord{};
        updated.profile = m_profile;
        updated.playerId = MintPlayerId();
        updated.createdAt = now;
    }
    updated.lastSignIn = now;
    ++updated.signInCount;

    std::string err;
    if (!SaveSessionRecord(SessionRecordPath(m_options.storeDir, m_profile), updated, &err))
        throw BackendError(BackendErrorCode::Unavailable, "cannot persist session for '" + m_profile + "': " + err);

    m_record = std::move(updated);
    m_hasRecord = true;
    m_signedIn = true;
    m_log->info("[Backend] Anonymous sign-in for '{}' (player {}, sign-in #{})",
                m_profile, m_record.playerId, m_record.signInCount);
}

std::string LocalIdentityBackend::CurrentSessionId() const
{
    std::lock_guard lk(m_mutex);
    RequireInitialized("CurrentSessionId");
    return m_signedIn ? m_record.playerId : std::string();
}

void LocalIdentityBackend::SignOut()
{
    std::lock_guard lk(m_mutex);
    m_signedIn = false;
}

std::string LocalIdentityBackend::ActiveProfile() const
{
    std::lock_guard lk(m_mutex);
    return m_profile;
}

std::string LocalIdentityBackend::Environment() const
{
    std::lock_guard lk(m_mutex);
    return m_environment;
}

void LocalIdentityBackend::SimulateLatency() const
{
    if (m_options.latency.count() > 0)
        std::this_thread::sleep_for(m_options.latency);
}

// Caller holds m_mutex.
void LocalIdentityBackend::RequireInitialized(const char* what) const
{
    if (!m_initialized)
        throw BackendError(BackendErrorCode::NotInitialized,
                           std::string(what) + " called before the identity backend was initialized");
}

} // namespace twinboot::backend
