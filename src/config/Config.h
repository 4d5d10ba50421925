#pragma once

#include <cstdint>
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

inline bool logLevelAtLeast(LogLevel level, LogLevel threshold) {
    return logLevelSeverity(level) <= logLevelSeverity(threshold);
}

struct Config {
    // chart
    std::string symbol           = "AAPL";
    std::string timeframe        = "1D";
    std::vector<std::string> indicators{};

    // market data
    std::string feedUrl          = "http://127.0.0.1:8000/series";
    int pollIntervalSec          = 10;
    int fetchTimeoutSec          = 15;

    // IO / paths
    std::string configFile       = "";

    // UI
    int windowWidth              = 1280;
    int windowHeight             = 720;
    bool windowFullscreen        = false;
    int resizeDebounceMs         = 100;

    // logs
    LogLevel logLevel            = LogLevel::Info;

    // util
    bool showHelp                = false;
    bool showVersion             = false;
};

}  // namespace config
