#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>

namespace lmv::config {

namespace {
constexpr int kMinWindowSize = 320;
constexpr int kMinIntervalMs = 50;

struct KeyBinding {
    const char* key;
    const char* env;
    const char* flag;
};

// Config file key, environment variable and long CLI flag for every setting.
constexpr KeyBinding kBindings[] = {
    {"feedMode", "LMV_FEED_MODE", "--feed-mode"},
    {"apiHost", "LMV_API_HOST", "--api-host"},
    {"apiPort", "LMV_API_PORT", "--api-port"},
    {"apiTls", "LMV_API_TLS", "--api-tls"},
    {"wsHost", "LMV_WS_HOST", "--ws-host"},
    {"wsPort", "LMV_WS_PORT", "--ws-port"},
    {"wsTls", "LMV_WS_TLS", "--ws-tls"},
    {"wsPathTemplate", "LMV_WS_PATH", "--ws-path"},
    {"pollIntervalMs", "LMV_POLL_INTERVAL_MS", "--poll-interval-ms"},
    {"backgroundPollIntervalMs", "LMV_BACKGROUND_POLL_INTERVAL_MS", "--background-poll-interval-ms"},
    {"renderIntervalMs", "LMV_RENDER_INTERVAL_MS", "--render-interval-ms"},
    {"backoffBaseMs", "LMV_BACKOFF_BASE_MS", "--backoff-base-ms"},
    {"backoffCapMs", "LMV_BACKOFF_CAP_MS", "--backoff-cap-ms"},
    {"failAfter", "LMV_FAIL_AFTER", "--fail-after"},
    {"tickCapacity", "LMV_TICK_CAPACITY", "--tick-capacity"},
    {"candleHistory", "LMV_CANDLE_HISTORY", "--candle-history"},
    {"granularity", "LMV_GRANULARITY", "--granularity"},
    {"backfillLimit", "LMV_BACKFILL_LIMIT", "--backfill-limit"},
    {"bookDepth", "LMV_BOOK_DEPTH", "--book-depth"},
    {"bookStepRatio", "LMV_BOOK_STEP_RATIO", "--book-step-ratio"},
    {"watchlist", "LMV_WATCHLIST", "--watchlist"},
    {"duckdbPath", "LMV_DUCKDB_PATH", "--duckdb-path"},
    {"windowWidth", "LMV_WINDOW_W", "--window-width"},
    {"windowHeight", "LMV_WINDOW_H", "--window-height"},
    {"fontPath", "LMV_FONT_PATH", "--font-path"},
    {"logLevel", "LMV_LOG_LEVEL", "--log-level"},
};

struct LevelName {
    LogLevel level;
    const char* name;
};

constexpr LevelName kLevelNames[] = {
    {LogLevel::Trace, "trace"},
    {LogLevel::Debug, "debug"},
    {LogLevel::Info, "info"},
    {LogLevel::Warn, "warn"},
    {LogLevel::Error, "error"},
};

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

const KeyBinding* findFlag(const std::string& flag) {
    for (const auto& binding : kBindings) {
        if (flag == binding.flag) {
            return &binding;
        }
    }
    return nullptr;
}
}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    const std::string path = locateConfigFile_(argc, argv);
    if (!path.empty()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file %s not found, using defaults\n", path.c_str());
        }
    }

    // Later layers override earlier ones.
    parseEnv_();
    parseCli_(argc, argv);
}

std::string ConfigProvider::locateConfigFile_(int argc, const char* const* argv) {
    std::string path;
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) {
            continue;
        }
        const std::string_view arg(argv[i]);
        if (arg == "--config" && i + 1 < argc && argv[i + 1]) {
            path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=") {
            path = std::string(arg.substr(9));
        }
    }
    if (path.empty()) {
        if (const char* fromEnv = std::getenv("LMV_CONFIG")) {
            path = fromEnv;
        }
    }
    return path;
}

LogLevel ConfigProvider::parseLogLevel(const std::string& value) {
    const std::string name = lowercase_(trim_(value));
    if (name == "warning") {
        return LogLevel::Warn;
    }
    for (const auto& entry : kLevelNames) {
        if (name == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

std::string ConfigProvider::logLevelToString(LogLevel level) {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

bool ConfigProvider::apply(const std::string& key, const std::string& rawValue) {
    const std::string value = trim_(rawValue);

    auto positiveInt = [&](int& target, int minimum) {
        int parsed{};
        if (!parseInt_(value, parsed) || parsed < minimum) {
            return false;
        }
        target = parsed;
        return true;
    };
    auto positiveSize = [&](std::size_t& target) {
        int parsed{};
        if (!parseInt_(value, parsed) || parsed <= 0) {
            return false;
        }
        target = static_cast<std::size_t>(parsed);
        return true;
    };
    auto flag = [&](bool& target) {
        bool parsed{};
        if (!parseBool_(value, parsed)) {
            return false;
        }
        target = parsed;
        return true;
    };

    if (key == "feedMode") {
        std::string mode = lowercase_(value);
        if (mode != "poll" && mode != "push") {
            return false;
        }
        cfg_.feedMode = mode;
        return true;
    }
    if (key == "apiHost") {
        cfg_.apiHost = value;
        return true;
    }
    if (key == "apiPort") {
        return positiveInt(cfg_.apiPort, 1);
    }
    if (key == "apiTls") {
        return flag(cfg_.apiTls);
    }
    if (key == "wsHost") {
        cfg_.wsHost = value;
        return true;
    }
    if (key == "wsPort") {
        return positiveInt(cfg_.wsPort, 1);
    }
    if (key == "wsTls") {
        return flag(cfg_.wsTls);
    }
    if (key == "wsPathTemplate" || key == "wsPath") {
        cfg_.wsPathTemplate = value;
        return true;
    }
    if (key == "pollIntervalMs") {
        return positiveInt(cfg_.pollIntervalMs, kMinIntervalMs);
    }
    if (key == "backgroundPollIntervalMs") {
        return positiveInt(cfg_.backgroundPollIntervalMs, kMinIntervalMs);
    }
    if (key == "renderIntervalMs") {
        return positiveInt(cfg_.renderIntervalMs, kMinIntervalMs);
    }
    if (key == "backoffBaseMs") {
        return positiveInt(cfg_.backoffBaseMs, 1);
    }
    if (key == "backoffCapMs") {
        return positiveInt(cfg_.backoffCapMs, 1);
    }
    if (key == "failAfter") {
        return positiveInt(cfg_.failAfter, 1);
    }
    if (key == "tickCapacity") {
        return positiveSize(cfg_.tickCapacity);
    }
    if (key == "candleHistory") {
        return positiveSize(cfg_.candleHistory);
    }
    if (key == "granularity") {
        cfg_.granularity = lowercase_(value);
        return true;
    }
    if (key == "backfillLimit") {
        return positiveSize(cfg_.backfillLimit);
    }
    if (key == "bookDepth") {
        return positiveSize(cfg_.bookDepth);
    }
    if (key == "bookStepRatio") {
        double parsed{};
        if (!parseDouble_(value, parsed) || !(parsed > 0.0) || parsed >= 1.0) {
            return false;
        }
        cfg_.bookStepRatio = parsed;
        return true;
    }
    if (key == "watchlist") {
        cfg_.watchlist = value;
        return true;
    }
    if (key == "duckdbPath") {
        cfg_.duckdbPath = value;
        return true;
    }
    if (key == "windowWidth") {
        int width{};
        if (!parseInt_(value, width)) {
            return false;
        }
        cfg_.windowWidth = std::max(width, kMinWindowSize);
        return true;
    }
    if (key == "windowHeight") {
        int height{};
        if (!parseInt_(value, height)) {
            return false;
        }
        cfg_.windowHeight = std::max(height, kMinWindowSize);
        return true;
    }
    if (key == "fontPath") {
        cfg_.fontPath = value;
        return true;
    }
    if (key == "logLevel") {
        cfg_.logLevel = parseLogLevel(value);
        return true;
    }
    return false;
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

        if (arg == "--help") {
            cfg_.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            cfg_.showVersion = true;
            continue;
        }
        if (arg == "--config") {
            takeNext(arg.c_str());
            continue;
        }
        if (arg.rfind("--config=", 0) == 0) {
            continue;
        }

        std::string flagName = arg;
        std::optional<std::string> inlineValue;
        if (auto eq = arg.find('='); eq != std::string::npos) {
            flagName = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }
        if (flagName == "-l") {
            flagName = "--log-level";
        }

        const KeyBinding* binding = findFlag(flagName);
        if (!binding) {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            continue;
        }

        std::optional<std::string> value = inlineValue ? inlineValue : takeNext(flagName.c_str());
        if (!value) {
            continue;
        }
        if (!apply(binding->key, *value)) {
            std::fprintf(stderr, "Invalid value for %s: %s\n", flagName.c_str(), value->c_str());
        }
    }
}

void ConfigProvider::parseEnv_() {
    for (const auto& binding : kBindings) {
        if (const char* value = std::getenv(binding.env)) {
            if (!apply(binding.key, value)) {
                std::fprintf(stderr, "Invalid value for %s: %s\n", binding.env, value);
            }
        }
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::fprintf(stderr, "Cannot read config file %s\n", path.c_str());
        return;
    }

    int lineNo = 0;
    for (std::string raw; std::getline(in, raw);) {
        ++lineNo;
        const std::string entry = trim_(raw);
        if (entry.empty() || entry.front() == '#') {
            continue;
        }
        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            std::fprintf(stderr, "%s:%d: expected key=value\n", path.c_str(), lineNo);
            continue;
        }
        const std::string key = trim_(entry.substr(0, eq));
        if (!apply(key, entry.substr(eq + 1))) {
            std::fprintf(stderr, "%s:%d: ignoring %s\n", path.c_str(), lineNo, key.c_str());
        }
    }
}

std::string ConfigProvider::trim_(const std::string& s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

bool ConfigProvider::parseBool_(const std::string& value, bool& out) {
    static constexpr std::string_view kTrue[] = {"1", "true", "yes", "on"};
    static constexpr std::string_view kFalse[] = {"0", "false", "no", "off"};
    const std::string word = lowercase_(value);
    if (std::find(std::begin(kTrue), std::end(kTrue), word) != std::end(kTrue)) {
        out = true;
        return true;
    }
    if (std::find(std::begin(kFalse), std::end(kFalse), word) != std::end(kFalse)) {
        out = false;
        return true;
    }
    return false;
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long parsed = std::strtol(value.c_str(), &end, 10);
    if (errno == ERANGE || end != value.c_str() + value.size() || parsed < std::numeric_limits<int>::min() ||
        parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool ConfigProvider::parseDouble_(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (errno == ERANGE || end != value.c_str() + value.size()) {
        return false;
    }
    out = parsed;
    return true;
}

std::string ConfigProvider::lowercase_(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace lmv::config
