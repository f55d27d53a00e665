#include "core/Config.h"

#include "io/AtomicFile.h"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace twinboot::core {

namespace {

    // Integer JSON value as int64; unsigned values past the int64 range saturate.
    std::int64_t WideInteger(const nlohmann::json& v) noexcept
    {
        constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
        if (v.is_number_unsigned())
        {
            const auto u = v.get<std::uint64_t>();
            return u > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<std::int64_t>(u);
        }
        return v.get<std::int64_t>();
    }

    int ClampLatency(std::int64_t v) noexcept
    {
        if (v < 0) return 0;
        if (v > kMaxLatencyMs) return kMaxLatencyMs;
        return static_cast<int>(v);
    }

    HostMode ParseHostMode(const nlohmann::json& v, HostMode fallback) noexcept
    {
        if (!v.is_string())
            return fallback;
        const std::string s = v.get<std::string>();
        if (s == "editor" || s == "Editor" || s == "host") return HostMode::Editor;
        if (s == "player" || s == "Player") return HostMode::Player;
        return fallback;
    }

    const nlohmann::json* FindObject(const nlohmann::json& j, const char* key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_object())
            return nullptr;
        return &*it;
    }

    void ReadBool(const nlohmann::json& obj, const char* key, bool& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_boolean())
            dst = it->get<bool>();
    }

    void ReadString(const nlohmann::json& obj, const char* key, std::string& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_string())
            dst = it->get<std::string>();
    }

    void ReadPath(const nlohmann::json& obj, const char* key, std::filesystem::path& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_string())
            dst = std::filesystem::path(it->get<std::string>());
    }

    int ReadSettingsVersion(const nlohmann::json& j) noexcept
    {
        if (auto it = j.find("version"); it != j.end() && it->is_number_integer())
        {
            const std::int64_t v = WideInteger(*it);
            return static_cast<int>(std::clamp<std::int64_t>(v, 0, std::numeric_limits<int>::max()));
        }
        return 0;
    }

} // namespace

const char* ToString(HostMode m) noexcept
{
    switch (m) {
    case HostMode::Player: return "player";
    case HostMode::Editor: return "editor";
    }
    return "player";
}

bool LoadClientConfig(const std::filesystem::path& path, ClientConfig& out) noexcept
{
    try
    {
        std::string text;
        std::string err;
        bool missing = false;
        if (!io::read_all(path, text, &err, &missing))
        {
            // Missing config is normal on first run.
            if (!missing)
                spdlog::warn("LoadClientConfig: {}", err);
            return false;
        }

        const nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object())
        {
            spdlog::warn("LoadClientConfig: {} is not a JSON object; using defaults", path.string());
            return false;
        }

        const int fileVersion = ReadSettingsVersion(j);
        if (fileVersion > kClientConfigSchemaVersion)
            spdlog::info("LoadClientConfig: {} has schema {} (newer than {}); reading known keys",
                         path.string(), fileVersion, kClientConfigSchemaVersion);

        ClientConfig cfg = out;

        if (const auto* identity = FindObject(j, "identity"))
        {
            if (auto it = identity->find("hostMode"); it != identity->end())
                cfg.hostMode = ParseHostMode(*it, cfg.hostMode);
            ReadBool(*identity, "useLaunchArgs", cfg.useLaunchArgs);
            ReadString(*identity, "launchArgKey", cfg.launchArgKey);
            ReadPath(*identity, "projectDir", cfg.projectDir);

            if (auto it = identity->find("detectors"); it != identity->end() && it->is_array())
            {
                std::vector<std::string> names;
                for (const auto& v : *it)
                {
                    if (v.is_string())
                        names.push_back(v.get<std::string>());
                }
                cfg.detectors = std::move(names);
            }
        }

        if (const auto* backend = FindObject(j, "backend"))
        {
            ReadPath(*backend, "storeDir", cfg.storeDir);
            ReadString(*backend, "environment", cfg.environment);
            if (auto it = backend->find("latencyMs"); it != backend->end() && it->is_number_integer())
                cfg.latencyMs = ClampLatency(WideInteger(*it));
        }

        if (const auto* logging = FindObject(j, "logging"))
        {
            ReadPath(*logging, "directory", cfg.logging.directory);
            ReadString(*logging, "level", cfg.logging.level);
            ReadBool(*logging, "async", cfg.logging.async);
            ReadBool(*logging, "console", cfg.logging.console);
        }

        // An empty key would match nothing; keep the previous one.
        if (cfg.launchArgKey.empty())
            cfg.launchArgKey = out.launchArgKey;

        out = std::move(cfg);
        return true;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("LoadClientConfig: failed to read {}: {}", path.string(), e.what());
        return false;
    }
}

bool SaveClientConfig(const std::filesystem::path& path, const ClientConfig& cfg) noexcept
{
    try
    {
        nlohmann::json j;
        j["version"] = kClientConfigSchemaVersion;

        j["identity"] = {
            {"hostMode", ToString(cfg.hostMode)},
            {"useLaunchArgs", cfg.useLaunchArgs},
            {"launchArgKey", cfg.launchArgKey},
            {"detectors", cfg.detectors},
            {"projectDir", cfg.projectDir.generic_string()},
        };

        j["backend"] = {
            {"storeDir", cfg.storeDir.generic_string()},
            {"environment", cfg.environment},
            {"latencyMs", ClampLatency(cfg.latencyMs)},
        };

        j["logging"] = {
            {"directory", cfg.logging.directory.generic_string()},
            {"level", cfg.logging.level},
            {"async", cfg.logging.async},
            {"console", cfg.logging.console},
        };

        std::string err;
        if (!io::write_atomic(path, j.dump(2) + "\n", &err))
        {
            spdlog::error("SaveClientConfig: {}", err);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        spdlog::error("SaveClientConfig: failed to write {}: {}", path.string(), e.what());
        return false;
    }
}

} // namespace twinboot::core
