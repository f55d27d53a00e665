#include <twinboot/IdentityBackend.h>

namespace twinboot {

const char* ToString(BackendErrorCode code) noexcept
{
    switch (code)
    {
    case BackendErrorCode::AlreadyInitialized: return "AlreadyInitialized";
    case BackendErrorCode::NotInitialized:     return "NotInitialized";
    case BackendErrorCode::InvalidProfile:     return "InvalidProfile";
    case BackendErrorCode::Unavailable:        return "Unavailable";
    case BackendErrorCode::SignInRejected:     return "SignInRejected";
    }
    return "Unknown";
}

} // namespace twinboot
