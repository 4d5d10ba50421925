#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include "domain/MarketDataSource.h"
#include "infra/http/HttpClient.h"

namespace infra::feed {

// MarketDataSource backed by the HTTP series endpoint:
//   GET <base>?symbol=<S>&timeframe=<T>
class SeriesApiClient : public domain::MarketDataSource {
public:
    SeriesApiClient(boost::asio::io_context& ioc, http::Url base, int timeoutSec);

    std::unique_ptr<domain::FetchHandle> fetchSeries(const domain::SeriesKey& key, Completion onDone) override;

    // Exposed for tests.
    static std::string buildTarget(const std::string& baseTarget, const domain::SeriesKey& key);

private:
    http::AsyncHttpClient client_;
    http::Url base_;
};

}  // namespace infra::feed
