#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "app/PaneAllocator.h"
#include "core/EventBus.h"
#include "domain/Types.h"
#include "indicators/IndicatorCache.h"
#include "indicators/IndicatorTypes.h"
#include "ui/RenderSurface.h"

namespace core {
class TimeSeriesStore;
}

namespace app {

class LiveFeed;

enum class ChartState { Idle, Loading, Live, Reconnecting };

const char* chart_state_name(ChartState state);

struct IndicatorInstance {
    std::uint64_t id{0};
    indicators::IndicatorSpec spec{};
    Placement placement{};
    // One handle per output series, in output order. Owned by the RenderSurface.
    std::vector<ui::SeriesHandle> handles{};
    bool failed{false};
};

struct IndicatorListing {
    std::uint64_t id{0};
    std::string label{};
    Placement placement{};
    bool failed{false};
};

// Top-level chart session: the active (symbol, timeframe), the feed driving the store, and the
// ordered set of indicator instances rendered on the surface.
class ChartController {
public:
    ChartController(core::TimeSeriesStore& store, core::EventBus& bus, LiveFeed& feed, ui::RenderSurface& surface);
    ~ChartController();

    ChartController(const ChartController&) = delete;
    ChartController& operator=(const ChartController&) = delete;

    // Idle -> Loading; starts the feed.
    void start(const domain::SeriesKey& key);

    // Keep every indicator instance; values are recomputed once the new series lands.
    void setTimeframe(domain::Timeframe timeframe);
    void setSymbol(const std::string& symbol);

    // Throws domain::ConfigError without touching any state. Returns the new instance id.
    std::uint64_t addIndicator(const indicators::IndicatorSpec& spec);

    // Unknown ids are ignored.
    void removeIndicator(std::uint64_t id);

    std::vector<IndicatorListing> list() const;
    const IndicatorInstance* instance(std::uint64_t id) const;

    ChartState state() const noexcept { return state_; }
    bool isLive() const noexcept;
    const domain::SeriesKey& key() const noexcept { return key_; }
    bool disposed() const noexcept { return disposed_; }
    const PaneAllocator& panes() const noexcept { return panes_; }
    const indicators::IndicatorCache& cache() const noexcept { return cache_; }

    // Stops the feed, releases every series and the surface. Idempotent.
    void dispose();

private:
    void switchTo_(const domain::SeriesKey& key);
    void onSeriesUpdated_(const core::EventBus::SeriesUpdated& event);
    void onFeedStatus_(const core::EventBus::FeedStatusChanged& event);
    void createSeries_(IndicatorInstance& instance);
    void renderInstance_(IndicatorInstance& instance);
    void clearInstance_(IndicatorInstance& instance);
    void setState_(ChartState next);

    core::TimeSeriesStore& store_;
    core::EventBus& bus_;
    LiveFeed& feed_;
    ui::RenderSurface& surface_;
    PaneAllocator panes_;
    indicators::IndicatorCache cache_;

    domain::SeriesKey key_{};
    ChartState state_{ChartState::Idle};
    std::vector<IndicatorInstance> instances_;
    std::uint64_t nextInstanceId_{1};
    bool disposed_{false};
    core::EventBus::Subscription seriesSubscription_;
    core::EventBus::Subscription statusSubscription_;
};

}  // namespace app
