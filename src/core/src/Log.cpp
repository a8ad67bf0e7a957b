/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "rdv/core/Log.hpp"

#include <cstdio>

namespace rdv::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char *kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto idx = static_cast<unsigned>(level);
        std::fprintf(
            stderr,
            "[%s][%.*s] %.*s\n",
            kLevelNames[idx],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }
};

StderrLogger  gDefaultLogger;
ILogger      *gActiveLogger  = &gDefaultLogger;
LogLevel      gMinLevel      = LogLevel::kInfo;

} // anonymous namespace

void     Log::setLogger(ILogger *logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void     Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()                  { return gMinLevel; }
bool     Log::enabled(LogLevel level)     { return level >= gMinLevel; }

void Log::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!enabled(level))
        return;
    gActiveLogger->write(level, tag, msg);
}

} // namespace rdv::core
