#include "app/Application.h"
#include "config/ConfigProvider.h"
#include "infra/http/HttpClient.h"
#include "logging/Log.h"

#include <exception>
#include <iostream>

namespace bootstrap {
namespace {
constexpr int kExitConfigError = 2;

void printHelp(const config::Config& defaults) {
    std::cout << "Usage: livechart [options]\n"
              << "  -s, --symbol SYMBOL         (default: " << defaults.symbol << ")\n"
              << "  -t, --timeframe TF          5M|15M|1H|4H|1D (default: " << defaults.timeframe << ")\n"
              << "      --feed-url URL          (default: " << defaults.feedUrl << ")\n"
              << "      --poll-interval SEC     (default: " << defaults.pollIntervalSec << ")\n"
              << "      --fetch-timeout SEC     (default: " << defaults.fetchTimeoutSec << ")\n"
              << "      --resize-debounce MS    (default: " << defaults.resizeDebounceMs << ")\n"
              << "      --indicator SPEC        Repeatable. SMA:20, EMA:50, RSI:14, MACD:12,26,9, StochRSI:14,14\n"
              << "      --config FILE           key=value file (symbol=..., timeframe=..., indicators=SMA:20;RSI:14)\n"
              << "  -w, --window-width N        (default: " << defaults.windowWidth << ")\n"
              << "  -h, --window-height N       (default: " << defaults.windowHeight << ")\n"
              << "  -f, --fullscreen            (default: " << (defaults.windowFullscreen ? "true" : "false") << ")\n"
              << "  -l, --log-level LEVEL       trace|debug|info|warn|error (default: "
              << config::ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "      --help                  Show this help\n"
              << "      --version               Show the version\n"
              << "Environment: LIVECHART_SYMBOL, LIVECHART_TIMEFRAME, LIVECHART_FEED_URL, LIVECHART_POLL_INTERVAL,\n"
              << "             LIVECHART_FETCH_TIMEOUT, LIVECHART_RESIZE_DEBOUNCE, LIVECHART_INDICATORS,\n"
              << "             LIVECHART_CONFIG, LIVECHART_WINDOW_W, LIVECHART_WINDOW_H, LIVECHART_FULLSCREEN,\n"
              << "             LIVECHART_LOG_LEVEL\n"
              << "Precedence: CLI > ENV > file > defaults\n"
              << "Keys: 1-5 timeframe, S/E/R/M/K add indicator, Backspace remove last, Delete remove all, Esc quit\n";
}

void printVersion() {
#ifdef PROJECT_NAME
    std::cout << PROJECT_NAME;
#else
    std::cout << "livechart";
#endif
#ifdef PROJECT_VERSION
    std::cout << ' ' << PROJECT_VERSION;
#endif
    std::cout << '\n';
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
             "Startup level=%s symbol=%s timeframe=%s indicators=%zu",
             logging::Log::level_to_string(config.logLevel),
             config.symbol.c_str(),
             config.timeframe.c_str(),
             config.indicators.size());

    const auto feedUrl = infra::http::parse_url(config.feedUrl);
    if (!feedUrl) {
        LOG_ERROR(logging::LogCategory::NET, "Invalid feed URL '%s' (expected http:// or https://)",
                  config.feedUrl.c_str());
        return kExitConfigError;
    }

    try {
        app::Application app(config, *feedUrl);
        app.run();
    }
    catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::UI, "Fatal: %s", ex.what());
        return 1;
    }
    return 0;
}

}  // namespace bootstrap

int main(int argc, char** argv) {
    return bootstrap::run(argc, argv);
}
