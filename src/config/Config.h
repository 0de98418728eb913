#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

struct Config {
    // endpoints
    std::string apiBaseUrl       = "http://localhost:8000";
    std::string wsBaseUrl        = "ws://localhost:8000";
    std::string authToken        = "";
    int httpTimeoutMs            = 30000;

    // duplex channels
    int reconnectIntervalMs      = 3000;
    int maxReconnectAttempts     = 5;
    std::string backtestChannel   = "/ws/backtest/%s";
    std::string collectionChannel = "/ws/data/collect/%s";
    std::string repairChannel     = "/ws/data/repair/%s";

    // polling
    int retryBaseMs              = 1000;
    int retryCapMs               = 30000;

    // notifications
    bool notifications           = true;

    // jobs ("kind:id" or bare id for backtests)
    std::vector<std::string> trackJobs;
    bool runBacktest             = false;
    bool collectData             = false;

    std::string configFile       = "";

    // logs
    LogLevel logLevel            = LogLevel::Info;

    // util
    bool showHelp                = false;
    bool showVersion             = false;
};

}  // namespace config
