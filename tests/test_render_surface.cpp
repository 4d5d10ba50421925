#include <chrono>
#include <iostream>
#include <set>

#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "logging/Log.h"
#include "ui/Palette.h"
#include "ui/RenderSurface.h"

using namespace std::chrono_literals;
using ui::RenderSurface;
using ui::SeriesOptions;
using ui::SurfaceSize;

namespace {

void pump(boost::asio::io_context& ioc, std::chrono::milliseconds duration) {
    ioc.restart();
    ioc.run_for(duration);
}

int testHandlesUnique() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 20ms, SurfaceSize{800, 600});
    std::set<ui::SeriesHandle> seen;
    for (int i = 0; i < 5; ++i) {
        const auto handle = surface.addSeries(SeriesOptions{});
        EXPECT_TRUE(handle != 0, "handles are non-zero");
        EXPECT_TRUE(seen.insert(handle).second, "handle " << handle << " issued twice");
        EXPECT_TRUE(surface.removeSeries(handle), "handle removable");
    }
    EXPECT_TRUE(surface.seriesCount() == 0, "all series removed");
    EXPECT_TRUE(!surface.removeSeries(*seen.begin()), "removing twice reports false");
    return 0;
}

int testScales() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 20ms, SurfaceSize{800, 600});
    EXPECT_TRUE(surface.scaleMargins(RenderSurface::kPriceScale).has_value(), "price scale exists");
    const auto volume = surface.scaleMargins(RenderSurface::kVolumeScale);
    EXPECT_TRUE(volume && testsupport::near(volume->top, 0.85), "volume sits in the bottom 15%");

    SeriesOptions options;
    options.scaleId = "pane_7";
    const auto a = surface.addSeries(options);
    const auto b = surface.addSeries(options);
    EXPECT_TRUE(surface.scaleMargins("pane_7").has_value(), "scale created with its first series");
    surface.removeSeries(a);
    EXPECT_TRUE(surface.scaleMargins("pane_7").has_value(), "scale kept while a series uses it");
    surface.removeSeries(b);
    EXPECT_TRUE(!surface.scaleMargins("pane_7").has_value(), "scale dropped with its last series");
    EXPECT_TRUE(surface.scaleMargins(RenderSurface::kPriceScale).has_value(), "base scales are never dropped");
    return 0;
}

int testVolumeColors() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 20ms, SurfaceSize{800, 600});
    const auto candles = testsupport::makeCandles(6);
    surface.setCandles(candles);
    EXPECT_TRUE(surface.candleCount() == 6 && surface.volume().size() == 6, "one volume bar per candle");
    for (std::size_t i = 0; i < candles.size(); ++i) {
        const auto& bar = surface.volume()[i];
        const auto expected = candles[i].bullish() ? ui::palette::kVolumeUp : ui::palette::kVolumeDown;
        EXPECT_TRUE(bar.color && *bar.color == expected, "volume bar " << i << " colored by candle direction");
        EXPECT_TRUE(bar.time == candles[i].time && testsupport::near(bar.value, candles[i].volume),
                    "volume bar " << i << " mirrors the candle");
    }
    const auto range = surface.visibleRange();
    EXPECT_TRUE(range.first == 0 && range.second == 5, "setCandles fits the full range");
    return 0;
}

int testZeroResizeIgnored() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 10ms, SurfaceSize{800, 600});
    surface.requestResize(SurfaceSize{0, 400});
    surface.requestResize(SurfaceSize{1024, 0});
    EXPECT_TRUE(!surface.resizePending(), "zero-sized requests are ignored");
    pump(ioc, 40ms);
    EXPECT_TRUE(surface.size() == (SurfaceSize{800, 600}) && surface.appliedResizes() == 0, "size unchanged");
    return 0;
}

int testDebounceLatestWins() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 30ms, SurfaceSize{800, 600});
    surface.requestResize(SurfaceSize{900, 600});
    surface.requestResize(SurfaceSize{1000, 650});
    surface.requestResize(SurfaceSize{1100, 700});
    EXPECT_TRUE(surface.size() == (SurfaceSize{800, 600}), "nothing applied before the debounce elapses");
    pump(ioc, 120ms);
    EXPECT_TRUE(surface.size() == (SurfaceSize{1100, 700}), "only the latest size is applied");
    EXPECT_TRUE(surface.appliedResizes() == 1, "a burst applies once, applied " << surface.appliedResizes());
    return 0;
}

int testResizeDeferredDuringPush() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 10ms, SurfaceSize{800, 600});
    surface.requestResize(SurfaceSize{640, 480});
    {
        RenderSurface::DataPushGuard guard(surface);
        pump(ioc, 50ms);
        EXPECT_TRUE(surface.pushInProgress(), "guard marks the push");
        EXPECT_TRUE(surface.size() == (SurfaceSize{800, 600}), "resize waits for the push to finish");
        {
            RenderSurface::DataPushGuard nested(surface);
        }
        EXPECT_TRUE(surface.size() == (SurfaceSize{800, 600}), "closing an inner guard does not apply it");
    }
    EXPECT_TRUE(!surface.pushInProgress(), "push finished");
    EXPECT_TRUE(surface.size() == (SurfaceSize{640, 480}), "deferred resize applied when the push ends");
    return 0;
}

int testDispose() {
    boost::asio::io_context ioc;
    RenderSurface surface(ioc, 10ms, SurfaceSize{800, 600});
    surface.setCandles(testsupport::makeCandles(4));
    const auto handle = surface.addSeries(SeriesOptions{});
    surface.requestResize(SurfaceSize{300, 300});
    surface.dispose();
    EXPECT_TRUE(surface.disposed(), "disposed");
    EXPECT_TRUE(surface.seriesCount() == 0 && surface.candleCount() == 0, "dispose releases every series");
    EXPECT_TRUE(!surface.hasSeries(handle), "handles are invalid after dispose");
    EXPECT_TRUE(surface.addSeries(SeriesOptions{}) == 0, "addSeries after dispose returns 0");
    pump(ioc, 40ms);
    EXPECT_TRUE(surface.size() == (SurfaceSize{800, 600}), "pending resize dropped on dispose");
    surface.dispose();
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    int failures = 0;
    failures += testHandlesUnique();
    failures += testScales();
    failures += testVolumeColors();
    failures += testZeroResizeIgnored();
    failures += testDebounceLatestWins();
    failures += testResizeDeferredDuringPush();
    failures += testDispose();
    if (failures != 0) {
        std::cerr << failures << " render surface check(s) failed\n";
        return 1;
    }
    return 0;
}
