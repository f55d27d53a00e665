#include "identity/ProfileSanitizer.h"

#include <algorithm>

namespace twinboot::identity {

std::string SanitizeProfile(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    for (const char c : raw)
    {
        if (IsProfileChar(c))
            out.push_back(c);
    }
    return out;
}

bool IsSanitizedProfile(std::string_view s) noexcept
{
    return std::all_of(s.begin(), s.end(), [](char c) { return IsProfileChar(c); });
}

} // namespace twinboot::identity
