#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "config/ConfigProvider.h"

using lmv::config::ConfigProvider;
using lmv::config::LogLevel;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

std::filesystem::path writeConfigFile() {
    const auto path = std::filesystem::temp_directory_path() / "lmv_test_config.conf";
    std::ofstream out(path);
    out << "# viewer settings\n"
        << "pollIntervalMs = 750\n"
        << "renderIntervalMs=400\n"
        << "watchlist = kraken:ETHUSD\n"
        << "bookDepth = 25\n"
        << "unknownKey = 1\n"
        << "not a pair\n";
    return path;
}

}  // namespace

int main() {
    {
        const char* argv[] = {"lmv"};
        ConfigProvider provider(1, argv);
        const auto& cfg = provider.get();
        expect(cfg.feedMode == "poll", "poll mode by default");
        expect(cfg.pollIntervalMs == 2000 && cfg.backgroundPollIntervalMs == 5000, "default cadences");
        expect(cfg.tickCapacity == 60 && cfg.granularity == "1m", "default series settings");
        expect(!cfg.showHelp && !cfg.showVersion, "no util flags by default");
    }

    const auto path = writeConfigFile();
    const std::string pathText = path.string();
    ::setenv("LMV_RENDER_INTERVAL_MS", "300", 1);
    ::setenv("LMV_BOOK_DEPTH", "40", 1);
    ::setenv("LMV_FEED_MODE", "carrier-pigeon", 1);
    {
        const char* argv[] = {"lmv", "--config", pathText.c_str(), "--book-depth", "12", "--feed-mode=push",
                              "-l", "debug", "--bogus", "--version"};
        ConfigProvider provider(10, argv);
        const auto& cfg = provider.get();
        expect(cfg.configFile == pathText, "config file recorded");
        expect(cfg.pollIntervalMs == 750, "file value over default");
        expect(cfg.renderIntervalMs == 300, "environment over file");
        expect(cfg.bookDepth == 12, "command line over environment");
        expect(cfg.feedMode == "push", "inline flag value accepted");
        expect(cfg.watchlist == "kraken:ETHUSD", "watchlist from file");
        expect(cfg.logLevel == LogLevel::Debug, "short log level flag");
        expect(cfg.showVersion, "version flag");
    }
    ::unsetenv("LMV_RENDER_INTERVAL_MS");
    ::unsetenv("LMV_BOOK_DEPTH");
    ::unsetenv("LMV_FEED_MODE");
    std::filesystem::remove(path);

    {
        const char* argv[] = {"lmv"};
        ConfigProvider provider(1, argv);
        expect(provider.apply("pollIntervalMs", " 250 "), "trimmed integer accepted");
        expect(provider.get().pollIntervalMs == 250, "applied value stored");
        expect(!provider.apply("pollIntervalMs", "10"), "interval below minimum rejected");
        expect(!provider.apply("pollIntervalMs", "12ms"), "trailing garbage rejected");
        expect(provider.get().pollIntervalMs == 250, "rejected value leaves setting untouched");
        expect(!provider.apply("tickCapacity", "0"), "zero capacity rejected");
        expect(!provider.apply("bookStepRatio", "1.5"), "step ratio must stay below one");
        expect(provider.apply("apiTls", "yes") && provider.get().apiTls, "boolean words accepted");
        expect(provider.apply("windowWidth", "10") && provider.get().windowWidth == 320, "window clamped");
        expect(provider.apply("granularity", "5M") && provider.get().granularity == "5m", "granularity lowercased");
        expect(!provider.apply("noSuchKey", "1"), "unknown key rejected");
    }

    expect(ConfigProvider::parseLogLevel("WARNING") == LogLevel::Warn, "warning alias");
    expect(ConfigProvider::parseLogLevel("chatty") == LogLevel::Info, "unknown level falls back to info");
    expect(ConfigProvider::logLevelToString(LogLevel::Error) == "error", "level names");

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_config passed\n";
    return 0;
}
