// tests/test_logging.cpp

#include <doctest/doctest.h>

#include "core/Log.h"
#include "io/AtomicFile.h"
#include "test_support/TempDir.h"

#include <string>

using namespace twinboot::core;
using twinboot::test::TempDir;

TEST_CASE("ParseLogLevel accepts spdlog level names in any case")
{
    spdlog::level::level_enum lvl = spdlog::level::info;

    CHECK(ParseLogLevel("trace", lvl));
    CHECK(lvl == spdlog::level::trace);
    CHECK(ParseLogLevel("WARN", lvl));
    CHECK(lvl == spdlog::level::warn);
    CHECK(ParseLogLevel("warning", lvl));
    CHECK(lvl == spdlog::level::warn);
    CHECK(ParseLogLevel("Error", lvl));
    CHECK(lvl == spdlog::level::err);
    CHECK(ParseLogLevel("off", lvl));
    CHECK(lvl == spdlog::level::off);
}

TEST_CASE("ParseLogLevel leaves the level untouched for unknown names")
{
    spdlog::level::level_enum lvl = spdlog::level::debug;
    CHECK_FALSE(ParseLogLevel("loud", lvl));
    CHECK_FALSE(ParseLogLevel("", lvl));
    CHECK(lvl == spdlog::level::debug);
}

TEST_CASE("InitLogging writes to twinboot.log in the configured directory")
{
    TempDir tmp("logging");
    const auto previous = spdlog::default_logger();

    LoggingConfig cfg;
    cfg.directory = tmp.Path() / "logs";
    cfg.level = "debug";
    cfg.console = false;

    auto log = InitLogging(cfg);
    REQUIRE(log);
    CHECK(log->name() == kLoggerName);
    CHECK(log->level() == spdlog::level::debug);
    CHECK(Logger() == log);
    CHECK(spdlog::default_logger() == log);

    log->debug("hello from the logging test");
    log->flush();

    std::string text;
    REQUIRE(twinboot::io::read_all(cfg.directory / "twinboot.log", text));
    CHECK(text.find("hello from the logging test") != std::string::npos);
    CHECK(text.find("[debug]") != std::string::npos);

    // Hand the default logger back to the rest of the suite.
    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(previous);
}
