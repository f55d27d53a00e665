#include "backend/SessionStore.h"

#include "io/AtomicFile.h"

#include <cstdint>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

namespace twinboot::backend {

namespace {

// Returns false only for an integer that does not fit `T`; missing keys and
// wrong types leave `dst` as is.
template <class T>
bool ReadIfPresent(const nlohmann::json& j, const char* key, T& dst)
{
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) dst = it->get<std::string>();
    } else if (it->is_number_unsigned()) {
        const auto v = it->get<std::uint64_t>();
        if (!std::in_range<T>(v)) return false;
        dst = static_cast<T>(v);
    } else if (it->is_number_integer()) {
        const auto v = it->get<std::int64_t>();
        if (!std::in_range<T>(v)) return false;
        dst = static_cast<T>(v);
    }
    return true;
}

} // namespace

std::filesystem::path SessionRecordPath(const std::filesystem::path& storeDir, const std::string& profile)
{
    return storeDir / profile / "session.json";
}

bool LoadSessionRecord(const std::filesystem::path& path, SessionRecord& out, std::string* err) noexcept
{
    try
    {
        std::string text;
        bool missing = false;
        if (!io::read_all(path, text, err, &missing, 64u * 1024u))
        {
            if (missing && err)
                err->clear();
            return false;
        }

        const nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (!j.is_object())
        {
            if (err) *err = path.string() + " is not a JSON object";
            return false;
        }

        SessionRecord rec;
        ReadIfPresent(j, "profile", rec.profile);
        ReadIfPresent(j, "playerId", rec.playerId);

        const char* badKey = nullptr;
        if (!ReadIfPresent(j, "createdAt", rec.createdAt))        badKey = "createdAt";
        else if (!ReadIfPresent(j, "lastSignIn", rec.lastSignIn)) badKey = "lastSignIn";
        else if (!ReadIfPresent(j, "signInCount", rec.signInCount)) badKey = "signInCount";

        if (badKey)
        {
            if (err) *err = path.string() + ": " + badKey + " is out of range";
            return false;
        }

        if (rec.playerId.empty())
        {
            if (err) *err = path.string() + " has no playerId";
            return false;
        }

        out = std::move(rec);
        return true;
    }
    catch (const std::exception& e)
    {
        if (err) *err = e.what();
        return false;
    }
}

bool SaveSessionRecord(const std::filesystem::path& path, const SessionRecord& record, std::string* err) noexcept
{
    try
    {
        nlohmann::json j;
        j["version"] = kSessionRecordSchemaVersion;
        j["profile"] = record.profile;
        j["playerId"] = record.playerId;
        j["createdAt"] = record.createdAt;
        j["lastSignIn"] = record.lastSignIn;
        j["signInCount"] = record.signInCount;

        return io::write_atomic(path, j.dump(2) + "\n", err);
    }
    catch (const std::exception& e)
    {
        if (err) *err = e.what();
        return false;
    }
}

} // namespace twinboot::backend
