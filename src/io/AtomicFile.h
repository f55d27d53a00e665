// src/io/AtomicFile.h
//
// Portable atomic publish + whole-file read for the small JSON documents this
// client persists (twinboot.json, per-profile session.json).
//
// Guarantees:
//  - Bytes go to a sibling "<final>.tmp", are flushed, then renamed over the
//    destination. Readers see either the old file or the new one, never a
//    partial write.
//  - Parent directories are created as needed.
//  - A leading UTF-8 BOM is stripped on read so hand-edited files still parse.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace twinboot::io {

namespace fs = std::filesystem;

/// Atomically write `bytes` to `final_path`.
///
/// @param final_path  Destination path to publish.
/// @param bytes       Entire file contents.
/// @param err         Optional: receives a human-readable error on failure.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr);

/// Read the entire file at `path` into `out`.
///
/// Files larger than `max_bytes` are rejected rather than truncated.
/// A missing file is reported through `missing` (when provided) so callers can
/// treat "first run" differently from a real I/O error.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr,
                            bool* missing = nullptr,
                            std::size_t max_bytes = 4u * 1024u * 1024u);

} // namespace twinboot::io
