#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "app/ChartController.h"
#include "app/LiveFeed.h"
#include "core/EventBus.h"
#include "core/TimeSeriesStore.h"
#include "domain/Errors.h"
#include "logging/Log.h"
#include "ui/Palette.h"
#include "ui/RenderSurface.h"

using namespace std::chrono_literals;
using app::ChartState;
using domain::SeriesKey;
using domain::Timeframe;
using indicators::IndicatorKind;
using indicators::IndicatorSpec;

namespace {

constexpr domain::TimestampSec kHour = 3600;

// Everything a chart session needs, wired the way Application wires it, minus the window.
struct Harness {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    ui::RenderSurface surface{ioc, 20ms, ui::SurfaceSize{1200, 800}};
    app::LiveFeed feed{ioc, source, store, bus, 1h};
    app::ChartController chart{store, bus, feed, surface};

    // Completes the newest outstanding request.
    bool deliver(std::vector<domain::Candle> candles) {
        return source.succeed(source.requests.size() - 1, std::move(candles));
    }
};

std::size_t pointsOf(const ui::RenderSurface& surface, ui::SeriesHandle handle) {
    const auto* data = surface.seriesData(handle);
    return data == nullptr ? 0 : data->size();
}

int testHandleCounts() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    h.deliver(testsupport::makeCandles(120));

    const auto sma = h.chart.addIndicator({IndicatorKind::SMA, {20}});
    const auto ema = h.chart.addIndicator({IndicatorKind::EMA, {20}});
    const auto rsi = h.chart.addIndicator({IndicatorKind::RSI, {14}});
    const auto macd = h.chart.addIndicator({IndicatorKind::MACD, {12, 26, 9}});
    const auto stoch = h.chart.addIndicator({IndicatorKind::StochRSI, {14, 14}});

    EXPECT_TRUE(h.chart.instance(sma)->handles.size() == 1, "SMA owns one series");
    EXPECT_TRUE(h.chart.instance(ema)->handles.size() == 1, "EMA owns one series");
    EXPECT_TRUE(h.chart.instance(rsi)->handles.size() == 1, "RSI owns one series");
    EXPECT_TRUE(h.chart.instance(macd)->handles.size() == 3, "MACD owns three series");
    EXPECT_TRUE(h.chart.instance(stoch)->handles.size() == 2, "StochRSI owns two series");
    EXPECT_TRUE(h.surface.seriesCount() == 8, "surface holds every indicator series");

    const auto* macdInstance = h.chart.instance(macd);
    EXPECT_TRUE(macdInstance->handles[2] < macdInstance->handles[0] && macdInstance->handles[2] < macdInstance->handles[1],
                "the MACD histogram is created before its lines");
    const auto* histOptions = h.surface.seriesOptions(macdInstance->handles[2]);
    EXPECT_TRUE(histOptions && histOptions->style == ui::SeriesStyle::Histogram, "MACD histogram style");
    for (const auto& point : *h.surface.seriesData(macdInstance->handles[2])) {
        const auto expected = point.value >= 0.0 ? ui::palette::kMacdHistUp : ui::palette::kMacdHistDown;
        EXPECT_TRUE(point.color && *point.color == expected, "histogram bars are colored by sign");
    }

    EXPECT_TRUE(pointsOf(h.surface, h.chart.instance(sma)->handles[0]) == 101, "SMA(20) over 120 candles has 101 points");
    const auto& smaPoints = *h.surface.seriesData(h.chart.instance(sma)->handles[0]);
    EXPECT_TRUE(smaPoints.back().time == h.store.current().back().time, "latest value pairs with the latest candle");
    return 0;
}

int testMacdHistogramColorsBothSigns() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) {
        closes.push_back(50.0 + 5.0 * std::sin(0.7 * i) + (i % 4));
    }
    h.deliver(testsupport::candlesFromCloses(closes));

    const auto macd = h.chart.addIndicator({IndicatorKind::MACD, {3, 6, 4}});
    const auto& bars = *h.surface.seriesData(h.chart.instance(macd)->handles[2]);
    EXPECT_TRUE(bars.size() == 22, "MACD(3,6,4) histogram has 22 bars, got " << bars.size());
    std::size_t up = 0;
    std::size_t down = 0;
    for (const auto& point : bars) {
        if (point.color && *point.color == ui::palette::kMacdHistUp && point.value >= 0.0) {
            ++up;
        }
        else if (point.color && *point.color == ui::palette::kMacdHistDown && point.value < 0.0) {
            ++down;
        }
    }
    EXPECT_TRUE(up == 12 && down == 10, "histogram bars colored by sign, got " << up << " up / " << down << " down");
    return 0;
}

int testTwoRsiPanes() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    h.deliver(testsupport::makeCandles(60));

    const auto a = h.chart.addIndicator({IndicatorKind::RSI, {14}});
    const auto b = h.chart.addIndicator({IndicatorKind::RSI, {14}});
    const auto* instA = h.chart.instance(a);
    const auto* instB = h.chart.instance(b);
    EXPECT_TRUE(instA->placement.scaleId != instB->placement.scaleId, "identical RSIs get distinct panes");
    EXPECT_TRUE(h.chart.panes().activePanes().size() == 2, "two panes active");
    const auto margins = h.surface.scaleMargins(instB->placement.scaleId);
    EXPECT_TRUE(margins && testsupport::near(margins->top, 0.8), "pane margins applied");

    const auto handleB = instB->handles[0];
    const auto paneB = instB->placement.scaleId;
    h.chart.removeIndicator(a);
    EXPECT_TRUE(h.chart.list().size() == 1 && h.chart.list()[0].id == b, "only the second RSI remains");
    EXPECT_TRUE(h.surface.hasSeries(handleB), "the remaining RSI keeps its series");
    EXPECT_TRUE(pointsOf(h.surface, handleB) == 46, "the remaining RSI keeps its data");
    EXPECT_TRUE(h.surface.scaleMargins(paneB).has_value(), "the remaining pane keeps its scale");
    EXPECT_TRUE(h.surface.seriesCount() == 1, "the removed RSI released its series");
    return 0;
}

int testRemoveUnknownIsNoop() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    h.chart.addIndicator({IndicatorKind::SMA, {5}});
    h.chart.removeIndicator(999);
    EXPECT_TRUE(h.chart.list().size() == 1 && h.surface.seriesCount() == 1, "unknown id leaves everything intact");
    return 0;
}

int testConfigErrorLeavesStateUnchanged() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    h.deliver(testsupport::makeCandles(50));
    h.chart.addIndicator({IndicatorKind::EMA, {10}});

    bool threw = false;
    try {
        h.chart.addIndicator({IndicatorKind::MACD, {26, 12, 9}});
    }
    catch (const domain::ConfigError&) {
        threw = true;
    }
    EXPECT_TRUE(threw, "invalid MACD rejected");
    EXPECT_TRUE(h.chart.list().size() == 1, "indicator list unchanged");
    EXPECT_TRUE(h.surface.seriesCount() == 1, "no series created for a rejected spec");
    EXPECT_TRUE(h.chart.panes().activePanes().empty(), "no pane allocated for a rejected spec");
    return 0;
}

int testIndicatorsSurviveTimeframeSwitch() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    h.deliver(testsupport::makeCandles(100));
    const auto sma = h.chart.addIndicator({IndicatorKind::SMA, {10}});
    const auto macd = h.chart.addIndicator({IndicatorKind::MACD, {12, 26, 9}});
    const auto smaHandle = h.chart.instance(sma)->handles[0];

    h.chart.setTimeframe(Timeframe::H1);
    EXPECT_TRUE(h.chart.state() == ChartState::Loading, "switching shows Loading");
    EXPECT_TRUE(h.chart.key().timeframe == Timeframe::H1, "key follows the switch");
    EXPECT_TRUE(h.chart.list().size() == 2, "indicators survive the switch");

    h.deliver(testsupport::makeCandles(40, 1710000000, kHour, 500.0));
    EXPECT_TRUE(h.chart.state() == ChartState::Live, "live after the new data lands");
    EXPECT_TRUE(h.chart.instance(sma)->handles[0] == smaHandle, "series handles are reused across the switch");
    EXPECT_TRUE(pointsOf(h.surface, smaHandle) == 31, "SMA recomputed over the new 40 candles");
    const auto& points = *h.surface.seriesData(smaHandle);
    EXPECT_TRUE(points.back().time == h.store.current().back().time, "SMA aligned to the new candles");
    EXPECT_TRUE(testsupport::near(points.back().value, 534.5), "SMA reflects the new closes, got " << points.back().value);
    EXPECT_TRUE(pointsOf(h.surface, h.chart.instance(macd)->handles[0]) == 40 - 33, "MACD recomputed");
    EXPECT_TRUE(h.surface.candleCount() == 40, "surface shows the new candles");
    EXPECT_TRUE(h.surface.visibleRange() == std::make_pair(std::size_t{0}, std::size_t{39}),
                "view refits to the new candles");
    return 0;
}

int testStateMachine() {
    Harness h;
    EXPECT_TRUE(h.chart.state() == ChartState::Idle, "a new chart is idle");
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    EXPECT_TRUE(h.chart.state() == ChartState::Loading, "start shows Loading");
    EXPECT_TRUE(!h.chart.isLive(), "not live while loading");

    h.deliver(testsupport::makeCandles(30));
    EXPECT_TRUE(h.chart.state() == ChartState::Live && h.chart.isLive(), "first success goes Live");

    h.source.fail(0);
    EXPECT_TRUE(h.chart.state() == ChartState::Live, "a completed request cannot fail afterwards");
    return 0;
}

int testReconnecting() {
    boost::asio::io_context ioc;
    testsupport::FakeMarketDataSource source;
    core::TimeSeriesStore store;
    core::EventBus bus;
    ui::RenderSurface surface(ioc, 20ms, ui::SurfaceSize{1200, 800});
    app::LiveFeed feed(ioc, source, store, bus, 10ms);
    app::ChartController chart(store, bus, feed, surface);

    chart.start(SeriesKey{"BTCUSDT", Timeframe::H1});
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (source.requests.size() < 3 && std::chrono::steady_clock::now() < deadline) {
        ioc.run_for(10ms);
    }
    EXPECT_TRUE(source.requests.size() >= 3, "poll timer issued three fetches");

    source.succeed(0, testsupport::makeCandles(30, 1700000000, kHour));
    EXPECT_TRUE(chart.state() == ChartState::Live, "Live after a success");
    source.fail(1);
    EXPECT_TRUE(chart.state() == ChartState::Reconnecting, "a failed poll shows Reconnecting");
    EXPECT_TRUE(surface.candleCount() == 30, "the last good candles stay on screen");
    source.succeed(2, testsupport::makeCandles(31, 1700000000, kHour));
    EXPECT_TRUE(chart.state() == ChartState::Live, "back to Live after recovery");
    chart.dispose();
    return 0;
}

int testComputeErrorIsolated() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    const auto good = h.chart.addIndicator({IndicatorKind::RSI, {2}});
    const auto bad = h.chart.addIndicator({IndicatorKind::SMA, {2}});
    h.deliver(testsupport::candlesFromCloses({1e308, 1e308, 1e308, 1e308, 1e308}));

    const auto* badInstance = h.chart.instance(bad);
    EXPECT_TRUE(badInstance->failed, "overflowing SMA is marked failed");
    EXPECT_TRUE(pointsOf(h.surface, badInstance->handles[0]) == 0, "failed instance shows no values");
    EXPECT_TRUE(!h.chart.instance(good)->failed, "other instances are unaffected");
    EXPECT_TRUE(pointsOf(h.surface, h.chart.instance(good)->handles[0]) == 3, "RSI still rendered");
    EXPECT_TRUE(h.chart.list().size() == 2, "the failed instance stays listed");
    EXPECT_TRUE(h.chart.state() == ChartState::Live, "compute failures do not affect the feed");
    return 0;
}

int testAddBeforeData() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    const auto ema = h.chart.addIndicator({IndicatorKind::EMA, {5}});
    const auto handle = h.chart.instance(ema)->handles[0];
    EXPECT_TRUE(pointsOf(h.surface, handle) == 0, "no values before the first snapshot");
    h.deliver(testsupport::makeCandles(12));
    EXPECT_TRUE(pointsOf(h.surface, handle) == 8, "values appear once data lands");

    const auto wide = h.chart.addIndicator({IndicatorKind::SMA, {50}});
    EXPECT_TRUE(pointsOf(h.surface, h.chart.instance(wide)->handles[0]) == 0, "warm-up longer than the data is empty");
    EXPECT_TRUE(!h.chart.instance(wide)->failed, "insufficient data is not a failure");
    return 0;
}

int testDispose() {
    Harness h;
    h.chart.start(SeriesKey{"BTCUSDT", Timeframe::D1});
    h.deliver(testsupport::makeCandles(40));
    h.chart.addIndicator({IndicatorKind::RSI, {14}});
    h.chart.addIndicator({IndicatorKind::MACD, {12, 26, 9}});
    h.chart.addIndicator({IndicatorKind::SMA, {5}});

    h.chart.dispose();
    EXPECT_TRUE(h.chart.disposed() && h.surface.disposed(), "dispose tears down the surface");
    EXPECT_TRUE(h.surface.seriesCount() == 0, "every series released");
    EXPECT_TRUE(h.chart.list().empty() && h.chart.panes().activePanes().empty(), "every instance released");
    EXPECT_TRUE(!h.feed.running(), "the feed is stopped");
    EXPECT_TRUE(h.bus.listenerCount() == 0, "bus subscriptions released");

    bool threw = false;
    try {
        h.chart.addIndicator({IndicatorKind::SMA, {5}});
    }
    catch (const domain::ConfigError&) {
        threw = true;
    }
    EXPECT_TRUE(threw, "adding to a disposed chart is rejected");
    h.chart.dispose();
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    int failures = 0;
    failures += testHandleCounts();
    failures += testMacdHistogramColorsBothSigns();
    failures += testTwoRsiPanes();
    failures += testRemoveUnknownIsNoop();
    failures += testConfigErrorLeavesStateUnchanged();
    failures += testIndicatorsSurviveTimeframeSwitch();
    failures += testStateMachine();
    failures += testReconnecting();
    failures += testComputeErrorIsolated();
    failures += testAddBeforeData();
    failures += testDispose();
    if (failures != 0) {
        std::cerr << failures << " chart controller check(s) failed\n";
        return 1;
    }
    return 0;
}
