#include "logging/Log.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <utility>
#include <vector>

namespace {
constexpr std::size_t kInlineMessageSize = 256;
// Response bodies are logged on parse failures; anything longer is cut.
constexpr std::size_t kMaxMessageSize = 16 * 1024;
}  // namespace

namespace logging {

std::atomic<config::LogLevel> Log::currentLevel{config::LogLevel::Info};

std::mutex Log::outputMutex;

std::shared_ptr<const Log::Sink> Log::activeSink;

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

void Log::SetGlobalLogLevel(config::LogLevel level) {
    set_log_level(level);
}

bool Log::enabled(config::LogLevel level) {
    return config::logLevelSeverity(level) >= config::logLevelSeverity(get_log_level());
}

void Log::set_sink(Sink sink) {
    auto next = sink ? std::make_shared<const Sink>(std::move(sink)) : nullptr;
    std::lock_guard<std::mutex> lock(outputMutex);
    activeSink = std::move(next);
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::CACHE:
        return "CACHE";
    case LogCategory::JOB:
        return "JOB";
    case LogCategory::UI:
        return "UI";
    }
    return "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

std::string Log::format(const char* fmt, std::va_list args) {
    char inlineBuffer[kInlineMessageSize];
    std::va_list sizing;
    va_copy(sizing, args);
    const int written = std::vsnprintf(inlineBuffer, sizeof(inlineBuffer), fmt, sizing);
    va_end(sizing);

    if (written < 0) {
        return "<format-error>";
    }
    if (static_cast<std::size_t>(written) < sizeof(inlineBuffer)) {
        return std::string(inlineBuffer, static_cast<std::size_t>(written));
    }

    const std::size_t length = std::min(static_cast<std::size_t>(written), kMaxMessageSize);
    std::vector<char> heap(length + 1);
    std::va_list again;
    va_copy(again, args);
    std::vsnprintf(heap.data(), heap.size(), fmt, again);
    va_end(again);

    std::string text(heap.data(), length);
    if (static_cast<std::size_t>(written) > kMaxMessageSize) {
        text.append("...");
    }
    return text;
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    Record record{level, category, 0, format(fmt, args)};
    record.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

    std::shared_ptr<const Sink> sink;
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        sink = activeSink;
    }
    if (sink) {
        (*sink)(record);
        return;
    }
    writeStderr(record);
}

void Log::writeStderr(const Record& record) {
    const std::time_t seconds = static_cast<std::time_t>(record.timestampMs / 1000);
    const int millis = static_cast<int>(record.timestampMs % 1000);

    std::tm utcTime{};
#if defined(_WIN32)
    gmtime_s(&utcTime, &seconds);
#else
    gmtime_r(&seconds, &utcTime);
#endif

    char timestamp[32];
    std::snprintf(timestamp,
                  sizeof(timestamp),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utcTime.tm_year + 1900,
                  utcTime.tm_mon + 1,
                  utcTime.tm_mday,
                  utcTime.tm_hour,
                  utcTime.tm_min,
                  utcTime.tm_sec,
                  millis);

    std::lock_guard<std::mutex> lock(outputMutex);
    std::fprintf(stderr,
                 "%s %-5s %-5s %s\n",
                 timestamp,
                 level_to_string(record.level),
                 category_to_string(record.category),
                 record.text.c_str());
    std::fflush(stderr);
}

}  // namespace logging
