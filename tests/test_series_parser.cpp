#include <iostream>
#include <string>

#include "TestSupport.h"
#include "domain/Errors.h"
#include "infra/feed/SeriesApiClient.h"
#include "infra/feed/SeriesParser.h"
#include "infra/http/HttpClient.h"

using infra::feed::parse_business_day;
using infra::feed::parse_series_json;

namespace {

bool parseFails(const std::string& body) {
    try {
        parse_series_json(body);
    }
    catch (const domain::FeedError&) {
        return true;
    }
    return false;
}

int testParser() {
    const auto candles = parse_series_json(R"([
        {"time": 1700000000, "open": 1.5, "high": 2, "low": 1, "close": 1.8, "volume": 1200},
        {"time": 1700086400000, "open": "1.8", "high": "2.5", "low": "1.7", "close": "2.4"},
        {"time": "2024-03-15", "open": 2.4, "high": 2.6, "low": 2.2, "close": 2.3, "volume": null}
    ])");
    EXPECT_TRUE(candles.size() == 3, "three rows parsed");
    EXPECT_TRUE(candles[0].time == 1700000000 && testsupport::near(candles[0].volume, 1200.0), "row 0 fields");
    EXPECT_TRUE(candles[1].time == 1700086400, "millisecond times are converted to seconds");
    EXPECT_TRUE(testsupport::near(candles[1].close, 2.4), "numeric strings are accepted");
    EXPECT_TRUE(testsupport::near(candles[1].volume, 0.0), "volume is optional");
    EXPECT_TRUE(candles[2].time == 1710460800, "business days map to UTC midnight");

    EXPECT_TRUE(parse_series_json("[]").empty(), "an empty array parses to no candles");
    EXPECT_TRUE(parseFails("not json"), "invalid JSON");
    EXPECT_TRUE(parseFails(R"({"time": 1})"), "top level must be an array");
    EXPECT_TRUE(parseFails(R"([1, 2])"), "rows must be objects");
    EXPECT_TRUE(parseFails(R"([{"time": 1, "open": 1, "high": 1, "low": 1}])"), "close is required");
    EXPECT_TRUE(parseFails(R"([{"time": 1, "open": "abc", "high": 1, "low": 1, "close": 1}])"), "bad numeric string");
    return 0;
}

int testBusinessDay() {
    domain::TimestampSec out = 0;
    EXPECT_TRUE(parse_business_day("1970-01-01", out) && out == 0, "epoch");
    EXPECT_TRUE(parse_business_day("2024-02-29", out) && out == 1709164800, "leap day");
    EXPECT_TRUE(!parse_business_day("2023-02-29", out), "not a leap year");
    EXPECT_TRUE(!parse_business_day("2024-13-01", out), "month out of range");
    EXPECT_TRUE(!parse_business_day("2024-1-01", out), "wrong shape");
    return 0;
}

int testUrls() {
    const auto plain = infra::http::parse_url("http://127.0.0.1:8000/series");
    EXPECT_TRUE(plain && plain->host == "127.0.0.1" && plain->port == "8000" && plain->target == "/series",
                "host, port and target split");
    EXPECT_TRUE(!plain->tls(), "http is not TLS");

    const auto secure = infra::http::parse_url("HTTPS://api.example.com?key=1");
    EXPECT_TRUE(secure && secure->tls() && secure->port == "443", "https defaults to 443");
    EXPECT_TRUE(secure->target == "/?key=1", "a bare query gets a root path");
    EXPECT_TRUE(secure->toString() == "https://api.example.com/?key=1", "default port omitted");

    EXPECT_TRUE(!infra::http::parse_url("ftp://example.com/"), "only http and https");
    EXPECT_TRUE(!infra::http::parse_url("http://user:pw@example.com/"), "userinfo rejected");
    EXPECT_TRUE(!infra::http::parse_url("http://example.com:99999/"), "port out of range");
    EXPECT_TRUE(!infra::http::parse_url("http:///path"), "host required");

    EXPECT_TRUE(infra::http::url_encode("BRK.B") == "BRK.B", "unreserved characters kept");
    EXPECT_TRUE(infra::http::url_encode("BTC/USD ^") == "BTC%2FUSD%20%5E", "reserved characters escaped");

    const domain::SeriesKey key{"BTC/USD", domain::Timeframe::M15};
    EXPECT_TRUE(infra::feed::SeriesApiClient::buildTarget("/series", key) ==
                    "/series?symbol=BTC%2FUSD&timeframe=15M",
                "query appended");
    EXPECT_TRUE(infra::feed::SeriesApiClient::buildTarget("/series?src=x", key) ==
                    "/series?src=x&symbol=BTC%2FUSD&timeframe=15M",
                "existing query extended");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testParser();
    failures += testBusinessDay();
    failures += testUrls();
    if (failures != 0) {
        std::cerr << failures << " feed parsing check(s) failed\n";
        return 1;
    }
    return 0;
}
