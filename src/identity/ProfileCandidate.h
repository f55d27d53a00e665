#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace twinboot::identity {

// Where a profile fragment came from. Values are ordered by precedence:
// fragments are always composed base role first, launch argument last.
enum class FragmentSource : std::uint8_t {
    BaseRole = 0,
    SiblingLabel = 1,
    LaunchArgument = 2,
};

[[nodiscard]] const char* ToString(FragmentSource source) noexcept;

struct ProfileFragment {
    FragmentSource source = FragmentSource::BaseRole;
    std::string text;
};

// Ordered, source-tagged fragments of the raw (unsanitized) profile.
//
// Append() keeps fragments sorted by FragmentSource while preserving the
// arrival order of fragments from the same source, so the collector may add
// signals in any order and composition still reads
//   base role, sibling label, launch argument(s).
class ProfileCandidate {
public:
    ProfileCandidate() = default;
    explicit ProfileCandidate(std::string baseRole);

    void Append(FragmentSource source, std::string text);

    [[nodiscard]] const std::vector<ProfileFragment>& Fragments() const noexcept { return m_fragments; }
    [[nodiscard]] bool HasSource(FragmentSource source) const noexcept;

    // Concatenation of every fragment from `source`, in arrival order.
    [[nodiscard]] std::string TextOf(FragmentSource source) const;

private:
    std::vector<ProfileFragment> m_fragments;
};

// Concatenates fragments in order with no separator. Pure; no sanitization.
[[nodiscard]] std::string ComposeProfile(const ProfileCandidate& candidate);

} // namespace twinboot::identity
