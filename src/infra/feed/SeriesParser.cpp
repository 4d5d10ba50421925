#include "infra/feed/SeriesParser.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "domain/Errors.h"

namespace infra::feed {
namespace {

constexpr std::int64_t kMillisecondThreshold = 100000000000LL;

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        std::size_t consumed = 0;
        try {
            const auto parsed = std::stoll(str, &consumed);
            if (consumed == str.size()) {
                return parsed;
            }
        }
        catch (const std::exception& ex) {
            throw domain::FeedError("invalid integer value '" + str + "': " + ex.what());
        }
        throw domain::FeedError("invalid integer value '" + str + "'");
    }
    throw domain::FeedError("unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        std::size_t consumed = 0;
        try {
            const double parsed = std::stod(str, &consumed);
            if (consumed == str.size()) {
                return parsed;
            }
        }
        catch (const std::exception& ex) {
            throw domain::FeedError("invalid numeric value '" + str + "': " + ex.what());
        }
        throw domain::FeedError("invalid numeric value '" + str + "'");
    }
    throw domain::FeedError("unsupported JSON type for floating conversion");
}

domain::TimestampSec json_to_time(const boost::json::value& value) {
    if (value.is_string()) {
        const auto& str = value.as_string();
        domain::TimestampSec day = 0;
        if (parse_business_day(std::string_view(str.data(), str.size()), day)) {
            return day;
        }
    }
    std::int64_t raw = json_to_int64(value);
    if (raw > kMillisecondThreshold) {
        raw /= 1000;
    }
    return raw;
}

const boost::json::value& require(const boost::json::object& row, const char* field, std::size_t index) {
    const auto* found = row.if_contains(field);
    if (found == nullptr || found->is_null()) {
        throw domain::FeedError("row " + std::to_string(index) + " missing '" + field + "'");
    }
    return *found;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

}  // namespace

bool parse_business_day(std::string_view text, domain::TimestampSec& out) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            return false;
        }
    }
    auto number = [&](std::size_t pos, std::size_t len) {
        int v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            v = v * 10 + (text[i] - '0');
        }
        return v;
    };
    const int year = number(0, 4);
    const int month = number(5, 2);
    const int day = number(8, 2);
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    const int maxDay = kDaysInMonth[month - 1] + ((month == 2 && is_leap(year)) ? 1 : 0);
    if (day > maxDay) {
        return false;
    }
    out = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400;
    return true;
}

domain::CandleBatch parse_series_json(std::string_view body) {
    boost::json::value json;
    try {
        json = boost::json::parse(boost::json::string_view(body.data(), body.size()));
    }
    catch (const std::exception& ex) {
        throw domain::FeedError(std::string{"failed to parse series response: "} + ex.what());
    }

    if (!json.is_array()) {
        throw domain::FeedError("unexpected series response type (expected array)");
    }

    const auto& rows = json.as_array();
    domain::CandleBatch candles;
    candles.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (!rows[i].is_object()) {
            throw domain::FeedError("row " + std::to_string(i) + " is not an object");
        }
        const auto& row = rows[i].as_object();
        domain::Candle candle{};
        candle.time = json_to_time(require(row, "time", i));
        candle.open = json_to_double(require(row, "open", i));
        candle.high = json_to_double(require(row, "high", i));
        candle.low = json_to_double(require(row, "low", i));
        candle.close = json_to_double(require(row, "close", i));
        if (const auto* volume = row.if_contains("volume"); volume != nullptr && !volume->is_null()) {
            candle.volume = json_to_double(*volume);
        }
        candles.push_back(candle);
    }
    return candles;
}

}  // namespace infra::feed
