#pragma once

#include "config/Config.h"

#include <string>

namespace lmv::config {

class ConfigProvider {
public:
    ConfigProvider(int argc, const char* const* argv);

    const Config& get() const { return cfg_; }

    static LogLevel parseLogLevel(const std::string& s);
    static std::string logLevelToString(LogLevel level);

    // Applies a single `key=value` pair using the config file key names.
    // Returns false when the key is unknown or the value does not parse.
    bool apply(const std::string& key, const std::string& value);

private:
    Config cfg_;
    void parseCli_(int argc, const char* const* argv);
    void parseEnv_();
    void parseFile_(const std::string& path);

    static std::string locateConfigFile_(int argc, const char* const* argv);
    static std::string trim_(const std::string& s);
    static bool parseBool_(const std::string& value, bool& out);
    static bool parseInt_(const std::string& value, int& out);
    static bool parseDouble_(const std::string& value, double& out);
    static std::string lowercase_(std::string s);
};

}  // namespace lmv::config
