#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lmv::config {

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
    // feed
    std::string feedMode              = "poll";
    std::string apiHost               = "localhost";
    int apiPort                       = 8080;
    bool apiTls                       = false;
    std::string wsHost                = "localhost";
    int wsPort                        = 8080;
    bool wsTls                        = false;
    std::string wsPathTemplate        = "/market-data/stream?venue=%s&symbol=%s";

    // cadence & retry
    int pollIntervalMs                = 2000;
    int backgroundPollIntervalMs      = 5000;
    int renderIntervalMs              = 1000;
    int backoffBaseMs                 = 1000;
    int backoffCapMs                  = 30000;
    int failAfter                     = 5;

    // series
    std::size_t tickCapacity          = 60;
    std::size_t candleHistory         = 200;
    std::string granularity           = "1m";
    std::size_t backfillLimit         = 200;

    // synthetic book
    std::size_t bookDepth             = 10;
    double bookStepRatio              = 0.001;

    // watchlist
    std::string watchlist             = "binance:BTCUSDT";
    std::string duckdbPath            = "./data/watchlist.duckdb";
    std::string configFile            = "";

    // UI
    int windowWidth                   = 1280;
    int windowHeight                  = 720;
    std::string fontPath              = "";

    // logs
    LogLevel logLevel                 = LogLevel::Info;

    // util
    bool showHelp                     = false;
    bool showVersion                  = false;
};

}  // namespace lmv::config
