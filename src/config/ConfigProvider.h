#pragma once

#include <string>

#include "config/Config.h"

namespace config {

// Precedence: CLI > ENV (FXS_*) > file (--config / FXS_CONFIG) > defaults.
class ConfigProvider {
public:
    ConfigProvider(int argc, const char* const* argv);

    const Config& get() const noexcept { return cfg_; }

    static LogLevel parseLogLevel(const std::string& value);
    static std::string logLevelToString(LogLevel l);

private:
    void parseCli_(int argc, const char* const* argv);
    void parseEnv_();
    void parseFile_(const std::string& path);
    void setPositive_(const std::string& value, int& target, const char* name);

    static bool fileExists_(const std::string& path);
    static std::string trim_(const std::string& s);
    static bool parseBool_(const std::string& value, bool& out);
    static bool parseInt_(const std::string& value, int& out);
    static std::string lowercase_(std::string s);

    Config cfg_;
};

}  // namespace config
