#include "app/Application.h"
#include "config/ConfigProvider.h"
#include "logging/Log.h"

#include <exception>
#include <iostream>

namespace lmv::bootstrap {
namespace {
void printHelp(const config::Config& defaults) {
    std::cout << "Usage: lmv_viewer [options]\n"
              << "      --feed-mode MODE            poll|push (default: " << defaults.feedMode << ")\n"
              << "      --api-host HOST             (default: " << defaults.apiHost << ")\n"
              << "      --api-port PORT             (default: " << defaults.apiPort << ")\n"
              << "      --api-tls BOOL              (default: " << (defaults.apiTls ? "true" : "false") << ")\n"
              << "      --ws-host HOST              (default: " << defaults.wsHost << ")\n"
              << "      --ws-port PORT              (default: " << defaults.wsPort << ")\n"
              << "      --ws-tls BOOL               (default: " << (defaults.wsTls ? "true" : "false") << ")\n"
              << "      --ws-path TEMPLATE          (default: " << defaults.wsPathTemplate << ")\n"
              << "      --poll-interval-ms MS       (default: " << defaults.pollIntervalMs << ")\n"
              << "      --background-poll-interval-ms MS (default: " << defaults.backgroundPollIntervalMs << ")\n"
              << "      --render-interval-ms MS     (default: " << defaults.renderIntervalMs << ")\n"
              << "      --tick-capacity N           (default: " << defaults.tickCapacity << ")\n"
              << "      --candle-history N          (default: " << defaults.candleHistory << ")\n"
              << "      --granularity LABEL         (default: " << defaults.granularity << ")  e.g. 1m, 15m, 4h, 1d\n"
              << "      --watchlist LIST            (default: " << defaults.watchlist << ")  venue:symbol,...\n"
              << "      --duckdb-path PATH          (default: " << defaults.duckdbPath << ")\n"
              << "      --config FILE               key=value file\n"
              << "  -l, --log-level LEVEL           trace|debug|info|warn|error (default: "
              << config::ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "      --help                      Show this help\n"
              << "      --version                   Show the version\n"
              << "Environment: LMV_FEED_MODE, LMV_API_HOST, LMV_WS_HOST, LMV_POLL_INTERVAL_MS, LMV_WATCHLIST,\n"
              << "             LMV_DUCKDB_PATH, LMV_LOG_LEVEL, LMV_CONFIG, ...\n"
              << "Precedence: CLI > ENV > file > defaults\n"
              << "Keys: Tab focus next, 1-9 timeframe, L/C/B line/candles/book, Esc quit\n";
}

void printVersion() {
    std::cout << LMV_PROJECT_NAME << ' ' << LMV_VERSION_STRING << '\n';
}
}  // namespace

int run(int argc, char** argv) {
    config::ConfigProvider provider(argc, argv);
    const config::Config& config = provider.get();

    if (config.showHelp) {
        printHelp(config::Config{});
        return 0;
    }

    if (config.showVersion) {
        printVersion();
        return 0;
    }

    logging::Log::set_log_level(config.logLevel);
    LOG_INFO(logging::LogCategory::UI,
             "Startup level=%s feed=%s granularity=%s",
             logging::Log::level_to_string(config.logLevel),
             config.feedMode.c_str(),
             config.granularity.c_str());

    try {
        app::Application app(config);
        app.run();
    }
    catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::UI, "Fatal: %s", ex.what());
        return 1;
    }
    return 0;
}

}  // namespace lmv::bootstrap

int main(int argc, char** argv) {
    return lmv::bootstrap::run(argc, argv);
}
