#include "infra/feed/SeriesApiClient.h"

#include <exception>
#include <utility>

#include "domain/Errors.h"
#include "infra/feed/SeriesParser.h"
#include "logging/Log.h"

namespace infra::feed {

SeriesApiClient::SeriesApiClient(boost::asio::io_context& ioc, http::Url base, int timeoutSec)
    : client_(ioc, timeoutSec), base_(std::move(base)) {}

std::string SeriesApiClient::buildTarget(const std::string& baseTarget, const domain::SeriesKey& key) {
    std::string target = baseTarget.empty() ? std::string{"/"} : baseTarget;
    target += target.find('?') == std::string::npos ? '?' : '&';
    target += "symbol=" + http::url_encode(key.symbol);
    target += "&timeframe=" + http::url_encode(domain::timeframe_label(key.timeframe));
    return target;
}

std::unique_ptr<domain::FetchHandle> SeriesApiClient::fetchSeries(const domain::SeriesKey& key, Completion onDone) {
    http::Url url = base_;
    url.target = buildTarget(base_.target, key);
    LOG_DEBUG(logging::LogCategory::NET, "fetching %s from %s", key.label().c_str(), url.toString().c_str());

    return client_.get(url, [label = key.label(), onDone = std::move(onDone)](http::HttpResult result) {
        if (result.failed()) {
            onDone(domain::FetchResult::failure(result.error));
            return;
        }
        const auto& response = result.value;
        if (response.status < 200U || response.status >= 300U) {
            onDone(domain::FetchResult::failure(label + ": HTTP status " + std::to_string(response.status)));
            return;
        }
        domain::CandleBatch candles;
        try {
            candles = parse_series_json(response.body);
        }
        catch (const domain::FeedError& ex) {
            onDone(domain::FetchResult::failure(label + ": " + ex.what()));
            return;
        }
        LOG_TRACE(logging::LogCategory::NET, "%s: parsed %zu rows", label.c_str(), candles.size());
        onDone(domain::FetchResult::success(std::move(candles)));
    });
}

}  // namespace infra::feed
