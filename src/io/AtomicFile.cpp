#include "io/AtomicFile.h"

#include <cstdio>
#include <fstream>
#include <system_error>

namespace {
    bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err) {
        std::ofstream f(temp, std::ios::binary | std::ios::trunc);
        if (!f) {
            if (err) *err = "cannot open " + temp.string() + " for writing";
            return false;
        }
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        f.flush();
        if (!f) {
            if (err) *err = "write failed for " + temp.string();
            return false;
        }
        return true;
    }

    void strip_utf8_bom(std::string& s) {
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEFu &&
            static_cast<unsigned char>(s[1]) == 0xBBu &&
            static_cast<unsigned char>(s[2]) == 0xBFu)
        {
            s.erase(0, 3);
        }
    }
}

namespace twinboot::io {
    bool write_atomic(const fs::path& final_path, std::string_view bytes, std::string* err)
    {
        std::error_code ec;
        if (final_path.has_parent_path()) {
            fs::create_directories(final_path.parent_path(), ec);
            if (ec) {
                if (err) *err = "create_directories failed for " + final_path.parent_path().string() + ": " + ec.message();
                return false;
            }
        }

        auto tmp = final_path; tmp += ".tmp";

        if (!write_temp_and_flush(tmp, bytes, err)) {
            fs::remove(tmp, ec);
            return false;
        }

        // rename() replaces an existing destination atomically on POSIX; on
        // Windows std::filesystem maps this to MoveFileExW(REPLACE_EXISTING).
        fs::rename(tmp, final_path, ec);
        if (ec) {
            if (err) *err = "rename to " + final_path.string() + " failed: " + ec.message();
            std::error_code rec;
            fs::remove(tmp, rec);
            return false;
        }
        return true;
    }

    bool read_all(const fs::path& path, std::string& out, std::string* err, bool* missing, std::size_t max_bytes)
    {
        if (missing) *missing = false;

        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            if (missing) *missing = true;
            if (err) *err = path.string() + " does not exist";
            return false;
        }
        if (!fs::is_regular_file(status)) {
            if (err) *err = path.string() + " is not a regular file";
            return false;
        }

        const auto size = fs::file_size(path, ec);
        if (ec) {
            if (err) *err = "file_size failed for " + path.string() + ": " + ec.message();
            return false;
        }
        if (size > max_bytes) {
            if (err) *err = path.string() + " exceeds " + std::to_string(max_bytes) + " bytes";
            return false;
        }

        std::ifstream f(path, std::ios::binary);
        if (!f) {
            if (err) *err = "cannot open " + path.string();
            return false;
        }

        std::string buf(static_cast<std::size_t>(size), '\0');
        if (size > 0)
            f.read(buf.data(), static_cast<std::streamsize>(size));
        if (!f && !f.eof()) {
            if (err) *err = "read failed for " + path.string();
            return false;
        }
        buf.resize(static_cast<std::size_t>(f.gcount() > 0 ? f.gcount() : 0));

        strip_utf8_bom(buf);
        out.swap(buf);
        return true;
    }
}
