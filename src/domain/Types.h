#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampSec = std::int64_t;
using Symbol = std::string;

struct Candle {
    TimestampSec time{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};

    bool bullish() const noexcept { return close >= open; }
};

enum class Timeframe { M5, M15, H1, H4, D1 };

inline constexpr std::array<Timeframe, 5> kAllTimeframes{
    Timeframe::M5, Timeframe::M15, Timeframe::H1, Timeframe::H4, Timeframe::D1};

inline const char* timeframe_label(Timeframe tf) {
    switch (tf) {
    case Timeframe::M5:
        return "5M";
    case Timeframe::M15:
        return "15M";
    case Timeframe::H1:
        return "1H";
    case Timeframe::H4:
        return "4H";
    case Timeframe::D1:
        return "1D";
    }
    return "1D";
}

inline TimestampSec timeframe_seconds(Timeframe tf) {
    switch (tf) {
    case Timeframe::M5:
        return 5 * 60;
    case Timeframe::M15:
        return 15 * 60;
    case Timeframe::H1:
        return 60 * 60;
    case Timeframe::H4:
        return 4 * 60 * 60;
    case Timeframe::D1:
        return 24 * 60 * 60;
    }
    return 24 * 60 * 60;
}

// Accepts "5M", "15m", "1h", "4H", "1d" and surrounding whitespace.
inline std::optional<Timeframe> timeframe_from_label(std::string_view label) {
    std::string normalized;
    normalized.reserve(label.size());
    for (char c : label) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    for (Timeframe tf : kAllTimeframes) {
        if (normalized == timeframe_label(tf)) {
            return tf;
        }
    }
    return std::nullopt;
}

struct SeriesKey {
    Symbol symbol;
    Timeframe timeframe{Timeframe::D1};

    std::string label() const { return symbol + "@" + timeframe_label(timeframe); }

    bool operator==(const SeriesKey& o) const { return symbol == o.symbol && timeframe == o.timeframe; }
    bool operator!=(const SeriesKey& o) const { return !(*this == o); }
};

}  // namespace domain
