#pragma once
//
// Logger that keeps its last messages in memory so tests can assert on
// warnings without touching the process-wide default logger.
//
#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace twinboot::test {

struct CapturedLog {
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
    std::shared_ptr<spdlog::logger> logger;

    [[nodiscard]] std::vector<std::string> Lines() const { return sink->last_formatted(); }

    [[nodiscard]] bool Contains(const std::string& needle) const
    {
        const auto lines = Lines();
        return std::any_of(lines.begin(), lines.end(),
                           [&](const std::string& l) { return l.find(needle) != std::string::npos; });
    }

    [[nodiscard]] std::size_t Count(const std::string& needle) const
    {
        const auto lines = Lines();
        return static_cast<std::size_t>(std::count_if(lines.begin(), lines.end(),
                           [&](const std::string& l) { return l.find(needle) != std::string::npos; }));
    }
};

inline CapturedLog MakeCapturedLog(const std::string& name = "test")
{
    CapturedLog c;
    c.sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
    c.sink->set_pattern("[%l] %v");
    c.logger = std::make_shared<spdlog::logger>(name, c.sink);
    c.logger->set_level(spdlog::level::trace);
    return c;
}

} // namespace twinboot::test
