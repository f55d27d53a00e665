#include "core/Log.h"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace twinboot::core {

namespace {

std::mutex g_loggerMutex;
std::shared_ptr<spdlog::logger> g_logger;

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

std::vector<spdlog::sink_ptr> MakeSinks(const LoggingConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (cfg.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.directory.empty())
    {
        std::error_code ec;
        fs::create_directories(cfg.directory, ec);
        if (ec)
        {
            // Still try to open the file; spdlog reports the real failure.
            spdlog::warn("Log directory {} could not be created ({})", cfg.directory.string(), ec.message());
        }

        const auto logPath = cfg.directory / "twinboot.log";
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), /*truncate=*/true));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("File logging disabled: {}", e.what());
        }
    }

    return sinks;
}

} // namespace

std::shared_ptr<spdlog::logger> InitLogging(const LoggingConfig& cfg)
{
    auto sinks = MakeSinks(cfg);

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.async)
    {
        // ShutdownLogging() releases the pool, so recreate it on demand.
        if (!spdlog::thread_pool())
            spdlog::init_thread_pool(8192, 1);

        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName,
            sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    }
    else
    {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    spdlog::level::level_enum level = spdlog::level::info;
    if (!ParseLogLevel(cfg.level, level))
        spdlog::warn("Unknown log level '{}', using info", cfg.level);

    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard lk(g_loggerMutex);
        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        g_logger = logger;
    }

    logger->info("Logging started (level={}, async={}, dir={})",
                 spdlog::level::to_string_view(level),
                 cfg.async,
                 cfg.directory.empty() ? std::string("<none>") : cfg.directory.string());
    return logger;
}

void ShutdownLogging() noexcept
{
    std::lock_guard lk(g_loggerMutex);
    if (g_logger)
        g_logger->flush();
    g_logger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Logger()
{
    std::lock_guard lk(g_loggerMutex);
    if (g_logger)
        return g_logger;
    return spdlog::default_logger();
}

bool ParseLogLevel(std::string_view text, spdlog::level::level_enum& out) noexcept
{
    struct Entry { std::string_view name; spdlog::level::level_enum level; };
    static constexpr Entry kLevels[] = {
        {"trace",    spdlog::level::trace},
        {"debug",    spdlog::level::debug},
        {"info",     spdlog::level::info},
        {"warn",     spdlog::level::warn},
        {"warning",  spdlog::level::warn},
        {"error",    spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off",      spdlog::level::off},
    };

    for (const auto& e : kLevels)
    {
        if (EqualsI(text, e.name))
        {
            out = e.level;
            return true;
        }
    }
    return false;
}

} // namespace twinboot::core
