#pragma once

#include "config/Config.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace logging {

enum class LogCategory { NET, DATA, CACHE, JOB, UI };

class Log {
public:
    static void set_log_level(config::LogLevel level);
    static config::LogLevel get_log_level();
    static void SetGlobalLogLevel(config::LogLevel level);

    static const char* level_to_string(config::LogLevel level);
    static const char* category_to_string(LogCategory category);

    static bool enabled(config::LogLevel level);

    struct Record {
        config::LogLevel level;
        LogCategory category;
        long long timestampMs;
        std::string text;
    };

    // Replaces stderr output; an empty sink restores it. The sink runs outside the output
    // lock and may log itself.
    using Sink = std::function<void(const Record&)>;
    static void set_sink(Sink sink);

    static void log(config::LogLevel level, LogCategory category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    static void vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args);
    static std::string format(const char* fmt, std::va_list args);
    static void writeStderr(const Record& record);

    static std::atomic<config::LogLevel> currentLevel;
    static std::mutex outputMutex;
    static std::shared_ptr<const Sink> activeSink;
};

}  // namespace logging

#define LOG_ERROR(cat, ...) ::logging::Log::log(::config::LogLevel::Error, (cat), __VA_ARGS__)
#define LOG_WARN(cat, ...)  ::logging::Log::log(::config::LogLevel::Warn,  (cat), __VA_ARGS__)
#define LOG_INFO(cat, ...)  ::logging::Log::log(::config::LogLevel::Info,  (cat), __VA_ARGS__)
#define LOG_DEBUG(cat, ...) ::logging::Log::log(::config::LogLevel::Debug, (cat), __VA_ARGS__)
#define LOG_TRACE(cat, ...) ::logging::Log::log(::config::LogLevel::Trace, (cat), __VA_ARGS__)

#define LOG_GUARD(expr, cat, ...)                                                                                      \
    do {                                                                                                                \
        if (!(expr)) {                                                                                                  \
            LOG_WARN((cat), __VA_ARGS__);                                                                               \
            return;                                                                                                     \
        }                                                                                                               \
    } while (false)

#define LOG_GUARD_RET(expr, cat, ret, ...)                                                                              \
    do {                                                                                                                \
        if (!(expr)) {                                                                                                  \
            LOG_WARN((cat), __VA_ARGS__);                                                                               \
            return (ret);                                                                                               \
        }                                                                                                               \
    } while (false)
