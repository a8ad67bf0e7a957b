/**
 * @file TestLog.cpp
 * @brief Unit tests for the rdv::core::Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include <rdv/core/Log.hpp>

#include <string>
#include <vector>

using namespace rdv::core;

namespace {

struct RecordingLogger final : ILogger
{
    struct Line
    {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        lines.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Line> lines;
};

struct LoggerGuard
{
    explicit LoggerGuard(ILogger& logger) : previous{Log::minLevel()} { Log::setLogger(&logger); }
    ~LoggerGuard()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(previous);
    }

    LogLevel previous;
};

} // namespace

TEST_CASE("Log forwards tag and message to the installed logger", "[core][log]")
{
    RecordingLogger logger;
    LoggerGuard guard{logger};
    Log::setMinLevel(LogLevel::kDebug);

    Log::warn("session", "sendToHost ignored");
    Log::info("plain");

    REQUIRE(logger.lines.size() == 2);
    REQUIRE(logger.lines[0].level == LogLevel::kWarn);
    REQUIRE(logger.lines[0].tag == "session");
    REQUIRE(logger.lines[0].message == "sendToHost ignored");
    REQUIRE(logger.lines[1].tag == "rdv");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    RecordingLogger logger;
    LoggerGuard guard{logger};
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("dispatch", "no handler");
    Log::info("session", "joined");
    Log::error("transport", "link lost");

    REQUIRE(logger.lines.size() == 1);
    REQUIRE(logger.lines[0].level == LogLevel::kError);
    REQUIRE_FALSE(Log::enabled(LogLevel::kInfo));
}

TEST_CASE("Formatted overloads build the message", "[core][log]")
{
    RecordingLogger logger;
    LoggerGuard guard{logger};
    Log::setMinLevel(LogLevel::kDebug);

    Log::infof("identity", "Attempt {}: registering '{}'", 2, "rdv-123456");

    REQUIRE(logger.lines.size() == 1);
    REQUIRE(logger.lines[0].message == "Attempt 2: registering 'rdv-123456'");
}
