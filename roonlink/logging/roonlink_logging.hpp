#pragma once

#include <iostream>
#include <sstream>

namespace roonlink
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Process-wide threshold, defined in logging.cpp
extern LogLevel current_log_level;

inline bool should_log(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(current_log_level);
}

inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

} // namespace logging
} // namespace roonlink

#define ROONLINK_SET_LOG_LEVEL(level) roonlink::logging::current_log_level = roonlink::logging::LogLevel::level

// The whole line is built first so lines from different threads do not interleave
#define ROONLINK_LOG_AT(level, message)                                                                                              \
    do                                                                                                                               \
    {                                                                                                                                \
        if (roonlink::logging::should_log(roonlink::logging::LogLevel::level))                                                       \
        {                                                                                                                            \
            std::ostringstream oss;                                                                                                  \
            oss << "[" << roonlink::logging::get_log_level_name(roonlink::logging::LogLevel::level) << "] " << __func__ << ": "      \
                << message << "\n";                                                                                                  \
            std::clog << oss.str();                                                                                                  \
        }                                                                                                                            \
    } while (0)

#define ROONLINK_LOG_ERROR(message)   ROONLINK_LOG_AT(Error, message)
#define ROONLINK_LOG_WARNING(message) ROONLINK_LOG_AT(Warning, message)
#define ROONLINK_LOG_INFO(message)    ROONLINK_LOG_AT(Info, message)
#define ROONLINK_LOG_DEBUG(message)   ROONLINK_LOG_AT(Debug, message)
#define ROONLINK_LOG_TRACE(message)   ROONLINK_LOG_AT(Trace, message)
