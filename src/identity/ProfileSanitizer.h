#pragma once

#include <string>
#include <string_view>

namespace twinboot::identity {

// True for the characters a backend profile may contain: [A-Za-z0-9_-].
[[nodiscard]] constexpr bool IsProfileChar(char c) noexcept
{
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

// Removes (does not replace) every character outside [A-Za-z0-9_-].
// Works on bytes, so every byte of a multi-byte UTF-8 sequence is dropped.
// Empty in, empty out.
[[nodiscard]] std::string SanitizeProfile(std::string_view raw);

[[nodiscard]] bool IsSanitizedProfile(std::string_view s) noexcept;

} // namespace twinboot::identity
