#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "core/LogUtils.h"
#include "domain/MarketDataSource.h"
#include "domain/Types.h"

namespace core {
class EventBus;
class TimeSeriesStore;
}

namespace app {

// Identifies one fetch. generation changes with the (symbol, timeframe) pair, sequence with every fetch.
struct FetchTicket {
    std::uint64_t generation{0};
    std::uint64_t sequence{0};
};

// Polls the market-data source at a fixed rate and replaces the store snapshot on each accepted
// response. Runs entirely on the io_context that drives it.
class LiveFeed {
public:
    LiveFeed(boost::asio::io_context& ioc,
             domain::MarketDataSource& source,
             core::TimeSeriesStore& store,
             core::EventBus& bus,
             std::chrono::milliseconds pollInterval);
    ~LiveFeed();

    LiveFeed(const LiveFeed&) = delete;
    LiveFeed& operator=(const LiveFeed&) = delete;

    void start(const domain::SeriesKey& key);

    // Drops liveness, cancels the timer and every in-flight fetch, fetches immediately and re-arms.
    void setParams(const domain::SeriesKey& key);

    // No callback touches the store or the bus after stop() returns.
    void stop();

    bool isLive() const noexcept { return live_; }
    bool running() const noexcept { return running_; }
    const domain::SeriesKey& key() const noexcept { return key_; }
    std::uint64_t generation() const noexcept { return generation_; }
    std::size_t inFlight() const noexcept { return inFlight_.size(); }
    std::chrono::milliseconds pollInterval() const noexcept { return interval_; }

private:
    void fetchNow_();
    void armTimer_(std::chrono::steady_clock::time_point deadline);
    void onTick_(boost::system::error_code ec, std::uint64_t timerEpoch);
    void onFetchDone_(FetchTicket ticket, domain::FetchResult result);
    void applySnapshot_(domain::CandleBatch candles);
    void markFailed_(const std::string& reason);
    void setLive_(bool live, bool fetchFailed, const std::string& message);
    void cancelInFlight_();

    domain::MarketDataSource& source_;
    core::TimeSeriesStore& store_;
    core::EventBus& bus_;
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;

    domain::SeriesKey key_{};
    bool running_{false};
    bool live_{false};
    std::uint64_t generation_{0};
    std::uint64_t nextSequence_{1};
    std::uint64_t lastAppliedSequence_{0};
    std::uint64_t timerEpoch_{0};
    std::map<std::uint64_t, std::unique_ptr<domain::FetchHandle>> inFlight_;
    core::LogRateLimiter failureLog_;
};

}  // namespace app
