#pragma once

// Contract between the identity bootstrap core and the backend identity/session
// service. Only the handful of operations the core drives are listed here.

#include <cstdint>
#include <future>
#include <stdexcept>
#include <string>

namespace twinboot {

enum class BackendErrorCode : std::uint8_t {
    AlreadyInitialized,  // Initialize() on an initialized backend (idempotent for callers)
    NotInitialized,      // session query before Initialize() completed
    InvalidProfile,      // profile rejected by the service
    Unavailable,         // transport/storage failure
    SignInRejected,      // service refused the anonymous sign-in
};

[[nodiscard]] const char* ToString(BackendErrorCode code) noexcept;

class BackendError : public std::runtime_error {
public:
    BackendError(BackendErrorCode code, const std::string& what)
        : std::runtime_error(what), m_code(code) {}

    [[nodiscard]] BackendErrorCode code() const noexcept { return m_code; }

private:
    BackendErrorCode m_code;
};

struct InitializationOptions {
    std::string profile;
    std::string environment = "production";
};

// Every call may fail by throwing BackendError (or any std::exception from the
// transport). Asynchronous calls report failure through the returned future.
class IIdentityBackend {
public:
    virtual ~IIdentityBackend() = default;

    // Stage the profile the next Initialize() runs under.
    virtual void ConfigureProfile(const std::string& profile) = 0;

    virtual std::future<void> Initialize(const InitializationOptions& options) = 0;
    virtual bool IsInitialized() const = 0;

    // Throws BackendError(NotInitialized) before initialization.
    virtual bool IsSignedIn() const = 0;

    virtual std::future<void> SignInAnonymously() = 0;

    // Identifier issued by the last successful sign-in; empty when signed out.
    virtual std::string CurrentSessionId() const = 0;
};

} // namespace twinboot
