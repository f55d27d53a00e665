#pragma once

#include <cstdint>
#include <string>

namespace twinboot::identity {

// Lifecycle of the one-per-process identity bootstrap. Not persisted.
enum class BootstrapState : std::uint8_t {
    Uninitialized = 0,
    Initializing  = 1,
    Initialized   = 2,
    Failed        = 3,
};

[[nodiscard]] constexpr const char* ToString(BootstrapState s) noexcept
{
    switch (s)
    {
    case BootstrapState::Uninitialized: return "Uninitialized";
    case BootstrapState::Initializing:  return "Initializing";
    case BootstrapState::Initialized:   return "Initialized";
    case BootstrapState::Failed:        return "Failed";
    }
    return "Unknown";
}

enum class BootstrapFailure : std::uint8_t {
    None = 0,
    MalformedProfile,
    InitializeFailed,
    SignInFailed,
    BackendUnavailable,
    Unexpected,
};

[[nodiscard]] constexpr const char* ToString(BootstrapFailure f) noexcept
{
    switch (f)
    {
    case BootstrapFailure::None:               return "None";
    case BootstrapFailure::MalformedProfile:   return "MalformedProfile";
    case BootstrapFailure::InitializeFailed:   return "InitializeFailed";
    case BootstrapFailure::SignInFailed:       return "SignInFailed";
    case BootstrapFailure::BackendUnavailable: return "BackendUnavailable";
    case BootstrapFailure::Unexpected:         return "Unexpected";
    }
    return "Unknown";
}

// Outcome of one bootstrap attempt. Collapsed to bool at the public boundary.
struct BootstrapResult {
    BootstrapFailure failure = BootstrapFailure::None;
    std::string message;     // what() of the underlying error
    std::string profile;     // sanitized profile used, when one was composed
    bool initializedNow = false;
    bool signedInNow = false;

    [[nodiscard]] bool ok() const noexcept { return failure == BootstrapFailure::None; }
    explicit operator bool() const noexcept { return ok(); }
};

} // namespace twinboot::identity
