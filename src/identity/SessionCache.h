#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace twinboot::identity {

class IdentityBootstrapper;

// Read-only view of the session identifier for the rest of the application.
// Holds the id of the last successful bootstrap; empty before the first one
// and after a failed one. Only IdentityBootstrapper writes it.
class SessionCache {
public:
    [[nodiscard]] std::optional<std::string> SessionId() const
    {
        std::lock_guard lk(m_mutex);
        return m_sessionId;
    }

    [[nodiscard]] bool HasSession() const
    {
        std::lock_guard lk(m_mutex);
        return m_sessionId.has_value();
    }

private:
    friend class IdentityBootstrapper;

    void Store(std::string id)
    {
        std::lock_guard lk(m_mutex);
        m_sessionId = std::move(id);
    }

    void Clear()
    {
        std::lock_guard lk(m_mutex);
        m_sessionId.reset();
    }

    mutable std::mutex m_mutex;
    std::optional<std::string> m_sessionId;
};

} // namespace twinboot::identity
