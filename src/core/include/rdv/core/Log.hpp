/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup; the test suite installs a
 * capturing logger to assert on warnings.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_CORE_LOG_HPP
    #define RDV_CORE_LOG_HPP

    #include "Types.hpp"

    #include <format>
    #include <string_view>
    #include <utility>

namespace rdv::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "session", "identity", "transport").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Not synchronised: the session layer runs on a single event loop.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();
    [[nodiscard]] static bool enabled(LogLevel level);

    static void write(LogLevel level, std::string_view tag, std::string_view msg);

    static void debug(std::string_view tag, std::string_view msg) { write(LogLevel::kDebug, tag, msg); }
    static void info (std::string_view tag, std::string_view msg) { write(LogLevel::kInfo,  tag, msg); }
    static void warn (std::string_view tag, std::string_view msg) { write(LogLevel::kWarn,  tag, msg); }
    static void error(std::string_view tag, std::string_view msg) { write(LogLevel::kError, tag, msg); }
    static void fatal(std::string_view tag, std::string_view msg) { write(LogLevel::kFatal, tag, msg); }

    static void debug(std::string_view msg) { debug("rdv", msg); }
    static void info (std::string_view msg) { info ("rdv", msg); }
    static void warn (std::string_view msg) { warn ("rdv", msg); }
    static void error(std::string_view msg) { error("rdv", msg); }

    /// @brief std::format variants; the message is only built when
    ///        @p level passes the current filter.
    template <typename... Args>
    static void writef(LogLevel level, std::string_view tag,
                       std::format_string<Args...> fmt, Args &&...args)
    {
        if (!enabled(level))
            return;
        write(level, tag, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debugf(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        writef(LogLevel::kDebug, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void infof(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        writef(LogLevel::kInfo, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warnf(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        writef(LogLevel::kWarn, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void errorf(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        writef(LogLevel::kError, tag, fmt, std::forward<Args>(args)...);
    }
};

} // namespace rdv::core

#endif // RDV_CORE_LOG_HPP
