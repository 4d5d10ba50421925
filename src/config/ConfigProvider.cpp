#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

#include "domain/Types.h"

namespace config {

namespace {
constexpr int kMinWindowSize = 320;
constexpr int kMinSeconds = 1;
constexpr int kMinDebounceMs = 0;
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
    else if (const char* envCfg = std::getenv("LIVECHART_CONFIG")) {
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
    sanitize_();
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

std::vector<std::string> ConfigProvider::splitIndicatorList(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream input(value);
    std::string item;
    while (std::getline(input, item, ';')) {
        item = trim_(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    auto addIndicator = [this](const std::string& value) {
        if (!cliIndicatorsSeen_) {
            cfg_.indicators.clear();
            cliIndicatorsSeen_ = true;
        }
        const std::string trimmed = trim_(value);
        if (!trimmed.empty()) {
            cfg_.indicators.push_back(trimmed);
        }
    };

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
        }
        else if (arg == "--version") {
            cfg_.showVersion = true;
        }
        else if (arg == "--symbol" || arg == "-s") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.symbol = *next;
            }
        }
        else if (arg == "--timeframe" || arg == "-t") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.timeframe = *next;
            }
        }
        else if (arg == "--feed-url") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.feedUrl = *next;
            }
        }
        else if (arg == "--poll-interval") {
            if (auto next = takeNext(arg.c_str())) {
                int value{};
                if (parseInt_(*next, value)) {
                    cfg_.pollIntervalSec = value;
                }
            }
        }
        else if (arg == "--fetch-timeout") {
            if (auto next = takeNext(arg.c_str())) {
                int value{};
                if (parseInt_(*next, value)) {
                    cfg_.fetchTimeoutSec = value;
                }
            }
        }
        else if (arg == "--resize-debounce") {
            if (auto next = takeNext(arg.c_str())) {
                int value{};
                if (parseInt_(*next, value)) {
                    cfg_.resizeDebounceMs = value;
                }
            }
        }
        else if (arg == "--indicator") {
            if (auto next = takeNext(arg.c_str())) {
                addIndicator(*next);
            }
        }
        else if (arg.rfind("--indicator=", 0) == 0) {
            addIndicator(arg.substr(12));
        }
        else if (arg == "--config") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.configFile = *next;
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cfg_.configFile = arg.substr(9);
        }
        else if (arg == "--window-width" || arg == "-w") {
            if (auto next = takeNext(arg.c_str())) {
                int value{};
                if (parseInt_(*next, value)) {
                    cfg_.windowWidth = value;
                }
            }
        }
        else if (arg == "--window-height" || arg == "-h") {
            if (auto next = takeNext(arg.c_str())) {
                int value{};
                if (parseInt_(*next, value)) {
                    cfg_.windowHeight = value;
                }
            }
        }
        else if (arg == "--fullscreen" || arg == "-f") {
            cfg_.windowFullscreen = true;
        }
        else if (arg.rfind("--fullscreen=", 0) == 0) {
            bool value = false;
            if (parseBool_(arg.substr(13), value)) {
                cfg_.windowFullscreen = value;
            }
            else {
                std::fprintf(stderr, "Invalid value for --fullscreen: %s\n", arg.c_str());
            }
        }
        else if (arg == "--log-level" || arg == "-l") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.logLevel = parseLogLevel(*next);
            }
        }
        else if (arg.rfind("--log-level=", 0) == 0) {
            cfg_.logLevel = parseLogLevel(arg.substr(12));
        }
        else if (arg.rfind("--symbol=", 0) == 0) {
            cfg_.symbol = arg.substr(9);
        }
        else if (arg.rfind("--timeframe=", 0) == 0) {
            cfg_.timeframe = arg.substr(12);
        }
        else if (arg.rfind("--feed-url=", 0) == 0) {
            cfg_.feedUrl = arg.substr(11);
        }
        else if (arg.rfind("--window-width=", 0) == 0) {
            int value{};
            if (parseInt_(arg.substr(15), value)) {
                cfg_.windowWidth = value;
            }
        }
        else if (arg.rfind("--window-height=", 0) == 0) {
            int value{};
            if (parseInt_(arg.substr(16), value)) {
                cfg_.windowHeight = value;
            }
        }
    }
}

void ConfigProvider::parseEnv_() {
    if (const char* value = std::getenv("LIVECHART_SYMBOL")) {
        cfg_.symbol = value;
    }
    if (const char* value = std::getenv("LIVECHART_TIMEFRAME")) {
        cfg_.timeframe = value;
    }
    if (const char* value = std::getenv("LIVECHART_FEED_URL")) {
        cfg_.feedUrl = value;
    }
    if (const char* value = std::getenv("LIVECHART_POLL_INTERVAL")) {
        int seconds{};
        if (parseInt_(value, seconds)) {
            cfg_.pollIntervalSec = seconds;
        }
    }
    if (const char* value = std::getenv("LIVECHART_FETCH_TIMEOUT")) {
        int seconds{};
        if (parseInt_(value, seconds)) {
            cfg_.fetchTimeoutSec = seconds;
        }
    }
    if (const char* value = std::getenv("LIVECHART_RESIZE_DEBOUNCE")) {
        int ms{};
        if (parseInt_(value, ms)) {
            cfg_.resizeDebounceMs = ms;
        }
    }
    if (const char* value = std::getenv("LIVECHART_INDICATORS")) {
        cfg_.indicators = splitIndicatorList(value);
    }
    if (const char* value = std::getenv("LIVECHART_WINDOW_W")) {
        int width{};
        if (parseInt_(value, width)) {
            cfg_.windowWidth = width;
        }
    }
    if (const char* value = std::getenv("LIVECHART_WINDOW_H")) {
        int height{};
        if (parseInt_(value, height)) {
            cfg_.windowHeight = height;
        }
    }
    if (const char* value = std::getenv("LIVECHART_FULLSCREEN")) {
        bool flag{};
        if (parseBool_(value, flag)) {
            cfg_.windowFullscreen = flag;
        }
    }
    if (const char* value = std::getenv("LIVECHART_LOG_LEVEL")) {
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

        if (key == "symbol") {
            cfg_.symbol = value;
        }
        else if (key == "timeframe") {
            cfg_.timeframe = value;
        }
        else if (key == "feedUrl") {
            cfg_.feedUrl = value;
        }
        else if (key == "pollIntervalSec") {
            int seconds{};
            if (parseInt_(value, seconds)) {
                cfg_.pollIntervalSec = seconds;
            }
        }
        else if (key == "fetchTimeoutSec") {
            int seconds{};
            if (parseInt_(value, seconds)) {
                cfg_.fetchTimeoutSec = seconds;
            }
        }
        else if (key == "resizeDebounceMs") {
            int ms{};
            if (parseInt_(value, ms)) {
                cfg_.resizeDebounceMs = ms;
            }
        }
        else if (key == "indicators") {
            cfg_.indicators = splitIndicatorList(value);
        }
        else if (key == "windowWidth") {
            int width{};
            if (parseInt_(value, width)) {
                cfg_.windowWidth = width;
            }
        }
        else if (key == "windowHeight") {
            int height{};
            if (parseInt_(value, height)) {
                cfg_.windowHeight = height;
            }
        }
        else if (key == "fullscreen") {
            bool flag{};
            if (parseBool_(value, flag)) {
                cfg_.windowFullscreen = flag;
            }
        }
        else if (key == "logLevel") {
            cfg_.logLevel = parseLogLevel(value);
        }
    }
}

void ConfigProvider::sanitize_() {
    cfg_.windowWidth = std::max(cfg_.windowWidth, kMinWindowSize);
    cfg_.windowHeight = std::max(cfg_.windowHeight, kMinWindowSize);
    cfg_.pollIntervalSec = std::max(cfg_.pollIntervalSec, kMinSeconds);
    cfg_.fetchTimeoutSec = std::max(cfg_.fetchTimeoutSec, kMinSeconds);
    cfg_.resizeDebounceMs = std::max(cfg_.resizeDebounceMs, kMinDebounceMs);

    if (auto tf = domain::timeframe_from_label(cfg_.timeframe)) {
        cfg_.timeframe = domain::timeframe_label(*tf);
    }
    else {
        std::fprintf(stderr, "Unknown timeframe '%s', using %s\n", cfg_.timeframe.c_str(), Config{}.timeframe.c_str());
        cfg_.timeframe = Config{}.timeframe;
    }
    cfg_.symbol = trim_(cfg_.symbol);
    if (cfg_.symbol.empty()) {
        cfg_.symbol = Config{}.symbol;
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
