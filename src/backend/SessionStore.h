#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace twinboot::backend {

// What the local backend remembers about one profile between runs.
//
// Stored in:
//   <storeDir>/<profile>/session.json
//
// One file per profile, so clones running under different profiles never
// write the same file.
struct SessionRecord
{
    std::string profile;
    std::string playerId;

    // Unix epoch milliseconds.
    std::int64_t createdAt = 0;
    std::int64_t lastSignIn = 0;

    std::uint32_t signInCount = 0;
};

inline constexpr int kSessionRecordSchemaVersion = 1;

[[nodiscard]] std::filesystem::path SessionRecordPath(const std::filesystem::path& storeDir, const std::string& profile);

// Returns true if the file existed and carried a usable record (non-empty
// playerId). On failure `out` is left unchanged; `err` says why unless the
// file was simply missing.
[[nodiscard]] bool LoadSessionRecord(const std::filesystem::path& path, SessionRecord& out, std::string* err = nullptr) noexcept;

// Atomic write. Returns true on success.
[[nodiscard]] bool SaveSessionRecord(const std::filesystem::path& path, const SessionRecord& record, std::string* err = nullptr) noexcept;

} // namespace twinboot::backend
