#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace config {

namespace {
constexpr int kMinReconnectIntervalMs = 100;

void appendJobs(std::vector<std::string>& out, const std::string& list) {
    std::string::size_type start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        std::string item = list.substr(start, comma - start);
        item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c) { return std::isspace(c) != 0; }),
                   item.end());
        if (!item.empty()) {
            out.push_back(item);
        }
        start = comma + 1;
    }
}
}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string cliConfigPath;
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);
        if (arg == "--config") {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for --config\n");
            }
            else {
                cliConfigPath = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cliConfigPath = arg.substr(9);
        }
    }

    if (!cliConfigPath.empty()) {
        if (fileExists_(cliConfigPath)) {
            parseFile_(cliConfigPath);
            cfg_.configFile = cliConfigPath;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", cliConfigPath.c_str());
        }
    }
    else if (const char* envCfg = std::getenv("FXS_CONFIG")) {
        std::string path(envCfg);
        if (fileExists_(path)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        }
    }

    parseEnv_();
    parseCli_(argc, argv);
}

LogLevel ConfigProvider::parseLogLevel(const std::string& value) {
    std::string lower = lowercase_(value);
    if (lower == "trace") {
        return LogLevel::Trace;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

std::string ConfigProvider::logLevelToString(LogLevel l) {
    switch (l) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

void ConfigProvider::setPositive_(const std::string& value, int& target, const char* name) {
    int parsed{};
    if (!parseInt_(value, parsed)) {
        return;
    }
    if (parsed <= 0) {
        std::fprintf(stderr, "Ignoring non-positive %s: %s\n", name, value.c_str());
        return;
    }
    target = parsed;
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);

        auto takeNext = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for %s\n", name);
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help" || arg == "-h") {
            cfg_.showHelp = true;
        }
        else if (arg == "--version") {
            cfg_.showVersion = true;
        }
        else if (arg == "--config") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.configFile = *next;
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cfg_.configFile = arg.substr(9);
        }
        else if (arg == "--api-url" || arg == "-a") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.apiBaseUrl = *next;
            }
        }
        else if (arg.rfind("--api-url=", 0) == 0) {
            cfg_.apiBaseUrl = arg.substr(10);
        }
        else if (arg == "--ws-url" || arg == "-w") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.wsBaseUrl = *next;
            }
        }
        else if (arg.rfind("--ws-url=", 0) == 0) {
            cfg_.wsBaseUrl = arg.substr(9);
        }
        else if (arg == "--token" || arg == "-t") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.authToken = *next;
            }
        }
        else if (arg == "--reconnect-interval") {
            if (auto next = takeNext(arg.c_str())) {
                setPositive_(*next, cfg_.reconnectIntervalMs, "reconnect interval");
            }
        }
        else if (arg.rfind("--reconnect-interval=", 0) == 0) {
            setPositive_(arg.substr(21), cfg_.reconnectIntervalMs, "reconnect interval");
        }
        else if (arg == "--max-reconnect-attempts") {
            if (auto next = takeNext(arg.c_str())) {
                setPositive_(*next, cfg_.maxReconnectAttempts, "max reconnect attempts");
            }
        }
        else if (arg.rfind("--max-reconnect-attempts=", 0) == 0) {
            setPositive_(arg.substr(25), cfg_.maxReconnectAttempts, "max reconnect attempts");
        }
        else if (arg == "--http-timeout") {
            if (auto next = takeNext(arg.c_str())) {
                setPositive_(*next, cfg_.httpTimeoutMs, "http timeout");
            }
        }
        else if (arg == "--no-notifications") {
            cfg_.notifications = false;
        }
        else if (arg.rfind("--notifications=", 0) == 0) {
            bool value = false;
            if (parseBool_(arg.substr(16), value)) {
                cfg_.notifications = value;
            }
            else {
                std::fprintf(stderr, "Invalid value for --notifications: %s\n", arg.c_str());
            }
        }
        else if (arg == "--track-job" || arg == "-j") {
            if (auto next = takeNext(arg.c_str())) {
                appendJobs(cfg_.trackJobs, *next);
            }
        }
        else if (arg.rfind("--track-job=", 0) == 0) {
            appendJobs(cfg_.trackJobs, arg.substr(12));
        }
        else if (arg == "--run-backtest") {
            cfg_.runBacktest = true;
        }
        else if (arg == "--collect-data") {
            cfg_.collectData = true;
        }
        else if (arg == "--log-level" || arg == "-l") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.logLevel = parseLogLevel(*next);
            }
        }
        else if (arg.rfind("--log-level=", 0) == 0) {
            cfg_.logLevel = parseLogLevel(arg.substr(12));
        }
    }

    if (cfg_.reconnectIntervalMs < kMinReconnectIntervalMs) {
        cfg_.reconnectIntervalMs = kMinReconnectIntervalMs;
    }
}

void ConfigProvider::parseEnv_() {
    if (const char* value = std::getenv("FXS_API_URL")) {
        cfg_.apiBaseUrl = value;
    }
    if (const char* value = std::getenv("FXS_WS_URL")) {
        cfg_.wsBaseUrl = value;
    }
    if (const char* value = std::getenv("FXS_AUTH_TOKEN")) {
        cfg_.authToken = value;
    }
    if (const char* value = std::getenv("FXS_RECONNECT_INTERVAL_MS")) {
        setPositive_(value, cfg_.reconnectIntervalMs, "reconnect interval");
    }
    if (const char* value = std::getenv("FXS_MAX_RECONNECT_ATTEMPTS")) {
        setPositive_(value, cfg_.maxReconnectAttempts, "max reconnect attempts");
    }
    if (const char* value = std::getenv("FXS_HTTP_TIMEOUT_MS")) {
        setPositive_(value, cfg_.httpTimeoutMs, "http timeout");
    }
    if (const char* value = std::getenv("FXS_NOTIFICATIONS")) {
        bool flag{};
        if (parseBool_(value, flag)) {
            cfg_.notifications = flag;
        }
    }
    if (const char* value = std::getenv("FXS_TRACK_JOBS")) {
        appendJobs(cfg_.trackJobs, value);
    }
    if (const char* value = std::getenv("FXS_LOG_LEVEL")) {
        cfg_.logLevel = parseLogLevel(value);
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::fprintf(stderr, "Unable to open config file: %s\n", path.c_str());
        return;
    }

    std::string line;
    while (std::getline(input, line)) {
        line = trim_(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = trim_(line.substr(0, pos));
        std::string value = trim_(line.substr(pos + 1));

        if (key == "apiUrl") {
            cfg_.apiBaseUrl = value;
        }
        else if (key == "wsUrl") {
            cfg_.wsBaseUrl = value;
        }
        else if (key == "authToken") {
            cfg_.authToken = value;
        }
        else if (key == "reconnectIntervalMs") {
            setPositive_(value, cfg_.reconnectIntervalMs, "reconnect interval");
        }
        else if (key == "maxReconnectAttempts") {
            setPositive_(value, cfg_.maxReconnectAttempts, "max reconnect attempts");
        }
        else if (key == "httpTimeoutMs") {
            setPositive_(value, cfg_.httpTimeoutMs, "http timeout");
        }
        else if (key == "retryBaseMs") {
            setPositive_(value, cfg_.retryBaseMs, "retry base");
        }
        else if (key == "retryCapMs") {
            setPositive_(value, cfg_.retryCapMs, "retry cap");
        }
        else if (key == "backtestChannel") {
            cfg_.backtestChannel = value;
        }
        else if (key == "collectionChannel") {
            cfg_.collectionChannel = value;
        }
        else if (key == "repairChannel") {
            cfg_.repairChannel = value;
        }
        else if (key == "notifications") {
            bool flag{};
            if (parseBool_(value, flag)) {
                cfg_.notifications = flag;
            }
        }
        else if (key == "trackJobs") {
            appendJobs(cfg_.trackJobs, value);
        }
        else if (key == "logLevel") {
            cfg_.logLevel = parseLogLevel(value);
        }
    }
}

bool ConfigProvider::fileExists_(const std::string& path) {
    std::ifstream input(path);
    return input.good();
}

std::string ConfigProvider::trim_(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

bool ConfigProvider::parseBool_(const std::string& value, bool& out) {
    std::string lower = lowercase_(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
        return false;
    }
}

std::string ConfigProvider::lowercase_(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace config
