#include "identity/ProfileCandidate.h"

#include <algorithm>
#include <utility>

namespace twinboot::identity {

const char* ToString(FragmentSource source) noexcept
{
    switch (source)
    {
    case FragmentSource::BaseRole:       return "base-role";
    case FragmentSource::SiblingLabel:   return "sibling-label";
    case FragmentSource::LaunchArgument: return "launch-argument";
    }
    return "unknown";
}

ProfileCandidate::ProfileCandidate(std::string baseRole)
{
    Append(FragmentSource::BaseRole, std::move(baseRole));
}

void ProfileCandidate::Append(FragmentSource source, std::string text)
{
    // Insert after the last fragment whose source is <= `source`.
    const auto pos = std::upper_bound(
        m_fragments.begin(), m_fragments.end(), source,
        [](FragmentSource s, const ProfileFragment& f) { return s < f.source; });
    m_fragments.insert(pos, ProfileFragment{source, std::move(text)});
}

bool ProfileCandidate::HasSource(FragmentSource source) const noexcept
{
    return std::any_of(m_fragments.begin(), m_fragments.end(),
                       [source](const ProfileFragment& f) { return f.source == source; });
}

std::string ProfileCandidate::TextOf(FragmentSource source) const
{
    std::string out;
    for (const auto& f : m_fragments)
    {
        if (f.source == source)
            out += f.text;
    }
    return out;
}

std::string ComposeProfile(const ProfileCandidate& candidate)
{
    std::string out;
    for (const auto& f : candidate.Fragments())
        out += f.text;
    return out;
}

} // namespace twinboot::identity
