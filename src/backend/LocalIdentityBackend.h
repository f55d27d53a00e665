#pragma once

#include "backend/SessionStore.h"
#include "common/ThreadPool.hpp"

#include <twinboot/IdentityBackend.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/logger.h>

namespace twinboot::backend {

struct LocalBackendOptions {
    std::filesystem::path storeDir;
    std::chrono::milliseconds latency{0};   // added to every async call
};

// File-backed identity service for local runs and tests.
//
// Anonymous sign-in is keyed only by the profile: the first sign-in under a
// profile mints a player id and stores it; later sign-ins under the same
// profile (from this or another process) get the same id back.
//
// Profile rules follow the hosted service: at most 30 characters of
// [A-Za-z0-9_-]; an empty profile selects "default".
class LocalIdentityBackend final : public IIdentityBackend {
public:
    static constexpr std::size_t kMaxProfileLength = 30;
    static constexpr const char* kDefaultProfile = "default";

    LocalIdentityBackend(LocalBackendOptions options, std::shared_ptr<spdlog::logger> logger);
    ~LocalIdentityBackend() override;

    void ConfigureProfile(const std::string& profile) override;
    std::future<void> Initialize(const InitializationOptions& options) override;
    bool IsInitialized() const override;
    bool IsSignedIn() const override;
    std::future<void> SignInAnonymously() override;
    std::string CurrentSessionId() const override;

    void SignOut();

    [[nodiscard]] std::string ActiveProfile() const;
    [[nodiscard]] std::string Environment() const;

private:
    void DoInitialize(InitializationOptions options);
    void DoSignIn();
    void SimulateLatency() const;
    void RequireInitialized(const char* what) const;

    LocalBackendOptions m_options;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    std::string m_stagedProfile;
    std::string m_profile;
    std::string m_environment;
    bool m_initialized = false;
    bool m_initializing = false;
    bool m_signedIn = false;
    SessionRecord m_record;
    bool m_hasRecord = false;

    // Last member: joined first on destruction, while the state above is alive.
    ThreadPool m_worker{1};
};

// Throws BackendError(InvalidProfile) if `profile` breaks the service rules.
void ValidateProfile(const std::string& profile);

} // namespace twinboot::backend
