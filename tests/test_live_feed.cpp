#include <chrono>
#include <iostream>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "app/LiveFeed.h"
#include "core/EventBus.h"
#include "core/TimeSeriesStore.h"
#include "logging/Log.h"

using namespace std::chrono_literals;
using domain::SeriesKey;
using domain::Timeframe;

namespace {

constexpr domain::TimestampSec kDay = 86400;
constexpr domain::TimestampSec kHour = 3600;

// Runs the loop until the fake has seen `count` requests or the deadline passes.
void pumpUntilRequests(boost::asio::io_context& ioc, testsupport::FakeMarketDataSource& source, std::size_t count) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (source.requests.size() < count && std::chrono::steady_clock::now() < deadline) {
        ioc.run_for(10ms);
        if (ioc.stopped()) {
            ioc.restart();
        }
    }
}

// Completes every fetch inside fetchSeries().
class ImmediateSource : public domain::MarketDataSource {
public:
    std::unique_ptr<domain::FetchHandle> fetchSeries(const SeriesKey&, Completion onDone) override {
        ++calls;
        onDone(domain::FetchResult::success(testsupport::makeCandles(3)));
        return nullptr;
    }
    int calls{0};
};

int testStaleFetchAcrossSwitch() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    source.deliverCancelled = true;
    core::TimeSeriesStore store;
    core::EventBus bus;
    app::LiveFeed feed(ioc, source, store, bus, 1h);

    feed.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    feed.setParams(SeriesKey{"BTCUSDT", Timeframe::H1});
    EXPECT_TRUE(source.requests.size() == 2, "a switch fetches immediately");
    EXPECT_TRUE(source.requests[0]->cancelled, "the 1D fetch is cancelled on switch");
    EXPECT_TRUE(source.requests[1]->key.timeframe == Timeframe::H1, "second fetch uses the new timeframe");

    EXPECT_TRUE(source.succeed(1, testsupport::makeCandles(24, 1700000000, kHour)), "1H fetch delivered");
    EXPECT_TRUE(store.version() == 1 && store.size() == 24, "1H snapshot applied");

    // The 1D response arrives late anyway.
    EXPECT_TRUE(source.succeed(0, testsupport::makeCandles(300, 1600000000, kDay)), "1D fetch delivered late");
    EXPECT_TRUE(store.version() == 1 && store.size() == 24, "stale 1D response must not replace the 1H data");
    EXPECT_TRUE(feed.isLive(), "feed stays live after discarding a stale response");
    return 0;
}

int testStaleWithinGeneration() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    app::LiveFeed feed(ioc, source, store, bus, 15ms);

    feed.start(SeriesKey{"ETHUSDT", Timeframe::M5});
    pumpUntilRequests(ioc, source, 2);
    EXPECT_TRUE(source.requests.size() >= 2, "the poll timer issued a second fetch");

    const std::size_t newer = source.requests.size() - 1;
    EXPECT_TRUE(source.succeed(newer, testsupport::makeCandles(10, 1700000000, 300)), "newer fetch delivered");
    EXPECT_TRUE(store.size() == 10, "newer snapshot applied");
    EXPECT_TRUE(source.succeed(0, testsupport::makeCandles(4, 1700000000, 300)), "older fetch delivered");
    EXPECT_TRUE(store.size() == 10 && store.version() == 1, "an older fetch never overwrites a newer one");
    feed.stop();
    return 0;
}

int testLivenessTransitions() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    std::vector<core::EventBus::FeedStatusChanged> events;
    auto sub = bus.subscribeFeedStatus([&](const core::EventBus::FeedStatusChanged& e) { events.push_back(e); });
    app::LiveFeed feed(ioc, source, store, bus, 10ms);

    feed.start(SeriesKey{"BTCUSDT", Timeframe::H1});
    pumpUntilRequests(ioc, source, 5);
    EXPECT_TRUE(source.requests.size() >= 5, "expected at least five polls, got " << source.requests.size());
    EXPECT_TRUE(!feed.isLive(), "not live before the first success");

    source.succeed(0, testsupport::makeCandles(10, 1700000000, kHour));
    source.succeed(1, testsupport::makeCandles(11, 1700000000, kHour));
    source.succeed(2, testsupport::makeCandles(12, 1700000000, kHour));
    EXPECT_TRUE(feed.isLive(), "live after successes");
    EXPECT_TRUE(events.size() == 1 && events[0].live, "only the transition to live is published");

    source.fail(3);
    EXPECT_TRUE(!feed.isLive(), "a failed fetch clears liveness");
    EXPECT_TRUE(events.size() == 2 && !events[1].live && events[1].fetchFailed, "failure is published");
    EXPECT_TRUE(store.size() == 12, "a failure keeps the last good snapshot");

    source.succeed(4, testsupport::makeCandles(13, 1700000000, kHour));
    EXPECT_TRUE(feed.isLive(), "the next success restores liveness");
    EXPECT_TRUE(events.size() == 3 && events[2].live, "recovery is published");
    EXPECT_TRUE(store.version() == 4, "four snapshots were accepted");

    // A malformed snapshot counts as a failed fetch.
    auto broken = testsupport::makeCandles(5, 1700000000, kHour);
    broken[3].time = broken[2].time;
    if (source.requests.size() > 5) {
        source.succeed(5, broken);
        EXPECT_TRUE(!feed.isLive(), "a rejected snapshot clears liveness");
        EXPECT_TRUE(store.version() == 4, "a rejected snapshot is not stored");
    }
    feed.stop();
    return 0;
}

int testCancelledNeverDelivered() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    app::LiveFeed feed(ioc, source, store, bus, 1h);

    feed.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    feed.setParams(SeriesKey{"SOLUSDT", Timeframe::D1});
    EXPECT_TRUE(!source.succeed(0, testsupport::makeCandles(5)), "a cancelled fetch must not complete");
    EXPECT_TRUE(store.version() == 0, "nothing was stored");
    EXPECT_TRUE(feed.inFlight() == 1, "only the current fetch is in flight");
    EXPECT_TRUE(feed.key().symbol == "SOLUSDT", "key follows setParams");
    return 0;
}

int testStop() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    source.deliverCancelled = true;
    core::TimeSeriesStore store;
    core::EventBus bus;
    int statusEvents = 0;
    auto sub = bus.subscribeFeedStatus([&](const core::EventBus::FeedStatusChanged&) { ++statusEvents; });
    app::LiveFeed feed(ioc, source, store, bus, 10ms);

    feed.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    feed.stop();
    EXPECT_TRUE(!feed.running() && feed.inFlight() == 0, "stop cancels every fetch");
    EXPECT_TRUE(source.requests[0]->cancelled, "the fake saw the cancellation");

    source.succeed(0, testsupport::makeCandles(5));
    EXPECT_TRUE(store.version() == 0 && statusEvents == 0, "no callback reaches the store or bus after stop");

    ioc.run_for(50ms);
    EXPECT_TRUE(source.requests.size() == 1, "the timer does not fire after stop");
    return 0;
}

int testFixedRateTick() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    app::LiveFeed feed(ioc, source, store, bus, 20ms);

    feed.start(SeriesKey{"BTCUSDT", Timeframe::M15});
    EXPECT_TRUE(source.requests.size() == 1, "start fetches immediately");
    ioc.run_for(110ms);
    EXPECT_TRUE(source.requests.size() >= 3, "timer keeps polling, got " << source.requests.size());
    EXPECT_TRUE(source.requests.size() <= 8, "timer polls at the configured rate, got " << source.requests.size());
    for (const auto& request : source.requests) {
        EXPECT_TRUE(request->key.timeframe == Timeframe::M15, "polls use the active key");
    }
    feed.stop();
    return 0;
}

int testSynchronousCompletion() {
    boost::asio::io_context ioc;
    ImmediateSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    app::LiveFeed feed(ioc, source, store, bus, 1h);

    feed.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    EXPECT_TRUE(source.calls == 1, "one fetch issued");
    EXPECT_TRUE(feed.inFlight() == 0, "a fetch completed inside fetchSeries leaves no in-flight entry");
    EXPECT_TRUE(feed.isLive() && store.version() == 1, "synchronous completion applied");
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    int failures = 0;
    failures += testStaleFetchAcrossSwitch();
    failures += testStaleWithinGeneration();
    failures += testLivenessTransitions();
    failures += testCancelledNeverDelivered();
    failures += testStop();
    failures += testFixedRateTick();
    failures += testSynchronousCompletion();
    if (failures != 0) {
        std::cerr << failures << " live feed check(s) failed\n";
        return 1;
    }
    return 0;
}
