#include "app/ChartController.h"

#include <algorithm>
#include <memory>
#include <optional>

#include "app/LiveFeed.h"
#include "core/TimeSeriesStore.h"
#include "domain/Errors.h"
#include "indicators/IndicatorEngine.h"
#include "logging/Log.h"
#include "ui/Palette.h"

namespace {

struct SeriesStyleSpec {
    ui::SeriesStyle style;
    sf::Color color;
    const char* title;
};

// Per output series, in IndicatorEngine output order.
std::vector<SeriesStyleSpec> stylesFor(indicators::IndicatorKind kind) {
    using indicators::IndicatorKind;
    switch (kind) {
    case IndicatorKind::SMA:
        return {{ui::SeriesStyle::Line, ui::palette::kSma, "SMA"}};
    case IndicatorKind::EMA:
        return {{ui::SeriesStyle::Line, ui::palette::kEma, "EMA"}};
    case IndicatorKind::RSI:
        return {{ui::SeriesStyle::Line, ui::palette::kRsi, "RSI"}};
    case IndicatorKind::MACD:
        return {{ui::SeriesStyle::Line, ui::palette::kMacdLine, "MACD"},
                {ui::SeriesStyle::Line, ui::palette::kMacdSignal, "Signal"},
                {ui::SeriesStyle::Histogram, ui::palette::kMacdHistUp, "Histogram"}};
    case IndicatorKind::StochRSI:
        return {{ui::SeriesStyle::Line, ui::palette::kStochK, "%K"},
                {ui::SeriesStyle::Line, ui::palette::kStochD, "%D"}};
    }
    return {};
}

// Handles are created in this order; the MACD histogram goes first so it sits beneath its lines.
std::vector<std::size_t> creationOrder(indicators::IndicatorKind kind, std::size_t count) {
    if (kind == indicators::IndicatorKind::MACD) {
        return {2, 0, 1};
    }
    std::vector<std::size_t> order(count);
    for (std::size_t i = 0; i < count; ++i) {
        order[i] = i;
    }
    return order;
}

}  // namespace

namespace app {

const char* chart_state_name(ChartState state) {
    switch (state) {
    case ChartState::Idle:
        return "Idle";
    case ChartState::Loading:
        return "Loading";
    case ChartState::Live:
        return "Live";
    case ChartState::Reconnecting:
        return "Reconnecting";
    }
    return "Unknown";
}

ChartController::ChartController(core::TimeSeriesStore& store,
                                 core::EventBus& bus,
                                 LiveFeed& feed,
                                 ui::RenderSurface& surface)
    : store_(store), bus_(bus), feed_(feed), surface_(surface), panes_(surface) {
    seriesSubscription_ = bus_.subscribeSeriesUpdated(
        [this](const core::EventBus::SeriesUpdated& event) { onSeriesUpdated_(event); });
    statusSubscription_ = bus_.subscribeFeedStatus(
        [this](const core::EventBus::FeedStatusChanged& event) { onFeedStatus_(event); });
}

ChartController::~ChartController() {
    dispose();
}

bool ChartController::isLive() const noexcept {
    return !disposed_ && feed_.isLive();
}

void ChartController::start(const domain::SeriesKey& key) {
    LOG_GUARD(!disposed_, logging::LogCategory::UI, "start on disposed chart ignored");
    key_ = key;
    setState_(ChartState::Loading);
    feed_.start(key_);
}

void ChartController::setTimeframe(domain::Timeframe timeframe) {
    LOG_GUARD(!disposed_, logging::LogCategory::UI, "setTimeframe on disposed chart ignored");
    domain::SeriesKey next = key_;
    next.timeframe = timeframe;
    switchTo_(next);
}

void ChartController::setSymbol(const std::string& symbol) {
    LOG_GUARD(!disposed_, logging::LogCategory::UI, "setSymbol on disposed chart ignored");
    LOG_GUARD(!symbol.empty(), logging::LogCategory::UI, "empty symbol ignored");
    domain::SeriesKey next = key_;
    next.symbol = symbol;
    switchTo_(next);
}

void ChartController::switchTo_(const domain::SeriesKey& key) {
    if (state_ == ChartState::Idle) {
        start(key);
        return;
    }
    if (key == key_) {
        LOG_DEBUG(logging::LogCategory::UI, "already showing %s", key.label().c_str());
        return;
    }
    LOG_INFO(logging::LogCategory::UI,
             "switching %s -> %s, keeping %zu indicator(s)",
             key_.label().c_str(),
             key.label().c_str(),
             instances_.size());
    key_ = key;
    setState_(ChartState::Loading);
    feed_.setParams(key_);
}

std::uint64_t ChartController::addIndicator(const indicators::IndicatorSpec& spec) {
    indicators::IndicatorEngine::validate(spec);
    if (disposed_) {
        throw domain::ConfigError("chart is disposed");
    }

    IndicatorInstance instance;
    instance.id = nextInstanceId_++;
    instance.spec = spec;
    instance.placement = panes_.allocate(instance.id, spec.kind);
    createSeries_(instance);
    panes_.configure(instance.placement);

    {
        ui::RenderSurface::DataPushGuard push(surface_);
        renderInstance_(instance);
    }

    LOG_INFO(logging::LogCategory::INDICATOR,
             "added #%llu %s on %s",
             static_cast<unsigned long long>(instance.id),
             spec.label().c_str(),
             instance.placement.overlay() ? "price scale" : instance.placement.scaleId.c_str());
    instances_.push_back(std::move(instance));
    return instances_.back().id;
}

void ChartController::removeIndicator(std::uint64_t id) {
    auto it = std::find_if(instances_.begin(), instances_.end(),
                           [id](const IndicatorInstance& instance) { return instance.id == id; });
    if (it == instances_.end()) {
        LOG_DEBUG(logging::LogCategory::INDICATOR, "remove #%llu: no such indicator",
                  static_cast<unsigned long long>(id));
        return;
    }
    for (ui::SeriesHandle handle : it->handles) {
        surface_.removeSeries(handle);
    }
    panes_.release(it->placement);
    LOG_INFO(logging::LogCategory::INDICATOR,
             "removed #%llu %s",
             static_cast<unsigned long long>(id),
             it->spec.label().c_str());
    instances_.erase(it);
}

std::vector<IndicatorListing> ChartController::list() const {
    std::vector<IndicatorListing> out;
    out.reserve(instances_.size());
    for (const auto& instance : instances_) {
        out.push_back(IndicatorListing{instance.id, instance.spec.label(), instance.placement, instance.failed});
    }
    return out;
}

const IndicatorInstance* ChartController::instance(std::uint64_t id) const {
    for (const auto& instance : instances_) {
        if (instance.id == id) {
            return &instance;
        }
    }
    return nullptr;
}

void ChartController::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    seriesSubscription_.reset();
    statusSubscription_.reset();
    feed_.stop();
    for (auto& instance : instances_) {
        panes_.release(instance.placement);
    }
    instances_.clear();
    cache_.invalidateAll();
    surface_.dispose();
    state_ = ChartState::Idle;
    LOG_INFO(logging::LogCategory::UI, "chart for %s disposed", key_.label().c_str());
}

void ChartController::onSeriesUpdated_(const core::EventBus::SeriesUpdated& event) {
    if (disposed_ || event.key != key_) {
        return;
    }
    LOG_DEBUG(logging::LogCategory::DATA,
              "%s v%llu: %zu candles",
              event.key.label().c_str(),
              static_cast<unsigned long long>(event.version),
              event.count);

    ui::RenderSurface::DataPushGuard push(surface_);
    surface_.setCandles(store_.current());
    for (auto& instance : instances_) {
        renderInstance_(instance);
    }
}

void ChartController::onFeedStatus_(const core::EventBus::FeedStatusChanged& event) {
    if (disposed_ || event.key != key_) {
        return;
    }
    if (event.live) {
        setState_(ChartState::Live);
    }
    else if (event.fetchFailed) {
        setState_(ChartState::Reconnecting);
    }
}

void ChartController::createSeries_(IndicatorInstance& instance) {
    const auto styles = stylesFor(instance.spec.kind);
    instance.handles.assign(styles.size(), 0);
    for (std::size_t index : creationOrder(instance.spec.kind, styles.size())) {
        ui::SeriesOptions options;
        options.style = styles[index].style;
        options.color = styles[index].color;
        options.scaleId = instance.placement.scaleId;
        options.title = styles[index].title;
        instance.handles[index] = surface_.addSeries(options);
    }
}

void ChartController::renderInstance_(IndicatorInstance& instance) {
    if (store_.version() == 0) {
        return;
    }
    const auto& candles = store_.current();

    std::shared_ptr<const indicators::IndicatorOutput> output;
    try {
        output = cache_.get(store_.version(), store_.closes(), instance.spec);
    }
    catch (const domain::ComputeError& ex) {
        LOG_WARN(logging::LogCategory::INDICATOR,
                 "#%llu %s failed: %s",
                 static_cast<unsigned long long>(instance.id),
                 instance.spec.label().c_str(),
                 ex.what());
        instance.failed = true;
        clearInstance_(instance);
        return;
    }
    if (instance.failed) {
        LOG_INFO(logging::LogCategory::INDICATOR,
                 "#%llu %s recovered",
                 static_cast<unsigned long long>(instance.id),
                 instance.spec.label().c_str());
    }
    instance.failed = false;

    const bool histogram = instance.spec.kind == indicators::IndicatorKind::MACD;
    for (std::size_t s = 0; s < instance.handles.size() && s < output->series.size(); ++s) {
        const auto aligned = indicators::IndicatorEngine::align(candles, output->series[s]);
        std::vector<ui::SeriesPoint> points;
        points.reserve(aligned.size());
        for (const auto& tv : aligned) {
            ui::SeriesPoint p{tv.time, tv.value, std::nullopt};
            if (histogram && s == 2) {
                p.color = tv.value >= 0.0 ? ui::palette::kMacdHistUp : ui::palette::kMacdHistDown;
            }
            points.push_back(p);
        }
        surface_.setSeriesData(instance.handles[s], std::move(points));
    }
}

void ChartController::clearInstance_(IndicatorInstance& instance) {
    for (ui::SeriesHandle handle : instance.handles) {
        surface_.setSeriesData(handle, {});
    }
}

void ChartController::setState_(ChartState next) {
    if (next == state_) {
        return;
    }
    LOG_INFO(logging::LogCategory::UI, "chart %s: %s -> %s", key_.label().c_str(), chart_state_name(state_),
             chart_state_name(next));
    state_ = next;
}

}  // namespace app
