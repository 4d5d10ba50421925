#include "ui/RenderSurface.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>

#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Graphics/VertexArray.hpp>

#include <boost/asio/error.hpp>

#include "logging/Log.h"
#include "ui/Palette.h"

namespace ui {

namespace {

constexpr float kPriceAxisWidth = 64.f;
constexpr float kTimeAxisHeight = 22.f;
constexpr float kBodyWidthRatio = 0.7f;
constexpr unsigned kAxisFontSize = 11;
constexpr int kPriceGridLines = 5;
constexpr float kMinTimeLabelSpacing = 90.f;

const ScaleMargins kPriceMargins{0.2, 0.1};
const ScaleMargins kVolumeMargins{0.85, 0.0};

struct ValueRange {
    double lo{std::numeric_limits<double>::max()};
    double hi{std::numeric_limits<double>::lowest()};

    bool valid() const { return lo <= hi; }

    void include(double v) {
        if (!std::isfinite(v)) {
            return;
        }
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    void widenIfFlat() {
        if (valid() && hi - lo < 1e-12) {
            const double pad = std::abs(hi) > 1e-12 ? std::abs(hi) * 0.01 : 1.0;
            lo -= pad;
            hi += pad;
        }
    }
};

std::string formatTime(domain::TimestampSec time, bool intraday) {
    const std::time_t seconds = static_cast<std::time_t>(time);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char buffer[24];
    if (intraday) {
        std::snprintf(buffer, sizeof(buffer), "%02d-%02d %02d:%02d", utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                      utc.tm_min);
    }
    else {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
    }
    return buffer;
}

std::string formatValue(double value) {
    char buffer[32];
    if (std::abs(value) >= 1e6) {
        std::snprintf(buffer, sizeof(buffer), "%.2fM", value / 1e6);
    }
    else if (std::abs(value) >= 1e3) {
        std::snprintf(buffer, sizeof(buffer), "%.1f", value);
    }
    else {
        std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    }
    return buffer;
}

float mapY(double value, const ValueRange& range, float top, float bottom) {
    const double t = (range.hi - value) / (range.hi - range.lo);
    return top + static_cast<float>(t) * (bottom - top);
}

void drawLabel(sf::RenderTarget& target,
               const sf::Font* font,
               const std::string& text,
               sf::Vector2f pos,
               sf::Color color,
               sf::Color background = sf::Color::Transparent) {
    if (font == nullptr) {
        return;
    }
    sf::Text label;
    label.setFont(*font);
    label.setCharacterSize(kAxisFontSize);
    label.setString(text);
    label.setFillColor(color);
    label.setPosition(pos);
    if (background.a != 0) {
        const auto bounds = label.getGlobalBounds();
        sf::RectangleShape box({bounds.width + 6.f, bounds.height + 6.f});
        box.setPosition(bounds.left - 3.f, bounds.top - 3.f);
        box.setFillColor(background);
        target.draw(box);
    }
    target.draw(label);
}

}  // namespace

RenderSurface::DataPushGuard::DataPushGuard(RenderSurface& surface) : surface_(surface) {
    surface_.beginPush_();
}

RenderSurface::DataPushGuard::~DataPushGuard() {
    surface_.endPush_();
}

RenderSurface::RenderSurface(boost::asio::io_context& ioc, std::chrono::milliseconds resizeDebounce, SurfaceSize initial)
    : resizeTimer_(ioc), resizeDebounce_(resizeDebounce), size_(initial) {
    margins_[kPriceScale] = kPriceMargins;
    margins_[kVolumeScale] = kVolumeMargins;
    LOG_DEBUG(logging::LogCategory::RENDER, "RenderSurface created %ux%u", size_.width, size_.height);
}

RenderSurface::~RenderSurface() {
    dispose();
}

SeriesHandle RenderSurface::addSeries(const SeriesOptions& options) {
    LOG_GUARD_RET(!disposed_, logging::LogCategory::RENDER, 0, "addSeries on disposed surface ignored");
    const SeriesHandle handle = nextHandle_++;
    series_.emplace(handle, SeriesEntry{options, {}});
    if (margins_.find(options.scaleId) == margins_.end()) {
        margins_[options.scaleId] = ScaleMargins{};
    }
    LOG_TRACE(logging::LogCategory::RENDER,
              "series #%llu added on scale '%s'",
              static_cast<unsigned long long>(handle),
              options.scaleId.c_str());
    return handle;
}

bool RenderSurface::removeSeries(SeriesHandle handle) {
    LOG_GUARD_RET(!disposed_, logging::LogCategory::RENDER, false, "removeSeries on disposed surface ignored");
    auto it = series_.find(handle);
    if (it == series_.end()) {
        LOG_DEBUG(logging::LogCategory::RENDER, "series #%llu not owned by surface",
                  static_cast<unsigned long long>(handle));
        return false;
    }
    const std::string scaleId = it->second.options.scaleId;
    series_.erase(it);

    // Drop the scale once nothing draws on it; the two base scales stay.
    if (scaleId != kPriceScale && scaleId != kVolumeScale) {
        const bool inUse = std::any_of(series_.begin(), series_.end(), [&](const auto& entry) {
            return entry.second.options.scaleId == scaleId;
        });
        if (!inUse) {
            margins_.erase(scaleId);
        }
    }
    return true;
}

void RenderSurface::setSeriesData(SeriesHandle handle, std::vector<SeriesPoint> points) {
    LOG_GUARD(!disposed_, logging::LogCategory::RENDER, "setSeriesData on disposed surface ignored");
    auto it = series_.find(handle);
    LOG_GUARD(it != series_.end(), logging::LogCategory::RENDER, "setSeriesData: unknown series #%llu",
              static_cast<unsigned long long>(handle));
    it->second.points = std::move(points);
}

void RenderSurface::setCandles(const std::vector<domain::Candle>& candles) {
    LOG_GUARD(!disposed_, logging::LogCategory::RENDER, "setCandles on disposed surface ignored");
    candles_ = candles;
    volume_.clear();
    volume_.reserve(candles_.size());
    for (const auto& c : candles_) {
        volume_.push_back(SeriesPoint{c.time, c.volume, c.bullish() ? palette::kVolumeUp : palette::kVolumeDown});
    }

    fitContent();
}

void RenderSurface::applyScaleMargins(const std::string& scaleId, ScaleMargins margins) {
    LOG_GUARD(!disposed_, logging::LogCategory::RENDER, "applyScaleMargins on disposed surface ignored");
    margins.top = std::clamp(margins.top, 0.0, 1.0);
    margins.bottom = std::clamp(margins.bottom, 0.0, 1.0 - margins.top);
    margins_[scaleId] = margins;
}

void RenderSurface::requestResize(SurfaceSize size) {
    LOG_GUARD(!disposed_, logging::LogCategory::RENDER, "resize on disposed surface ignored");
    if (size.width == 0 || size.height == 0) {
        LOG_TRACE(logging::LogCategory::RENDER, "ignoring zero-sized resize %ux%u", size.width, size.height);
        return;
    }
    pendingSize_ = size;
    resizeDue_ = false;
    const std::uint64_t epoch = ++resizeEpoch_;
    resizeTimer_.expires_after(resizeDebounce_);
    resizeTimer_.async_wait([this, epoch](const boost::system::error_code& ec) { onResizeTimer_(ec, epoch); });
}

void RenderSurface::onResizeTimer_(const boost::system::error_code& ec, std::uint64_t epoch) {
    if (ec == boost::asio::error::operation_aborted || epoch != resizeEpoch_ || disposed_) {
        return;
    }
    if (pushDepth_ > 0) {
        resizeDue_ = true;
        LOG_TRACE(logging::LogCategory::RENDER, "resize deferred until data push completes");
        return;
    }
    applyPendingSize_();
}

void RenderSurface::applyPendingSize_() {
    resizeDue_ = false;
    if (!pendingSize_) {
        return;
    }
    size_ = *pendingSize_;
    pendingSize_.reset();
    ++appliedResizes_;
    LOG_DEBUG(logging::LogCategory::RENDER, "resize applied width=%u height=%u", size_.width, size_.height);
    fitContent();
}

void RenderSurface::beginPush_() {
    ++pushDepth_;
}

void RenderSurface::endPush_() {
    if (pushDepth_ > 0) {
        --pushDepth_;
    }
    if (pushDepth_ == 0 && resizeDue_ && !disposed_) {
        applyPendingSize_();
    }
}

void RenderSurface::fitContent() {
    if (candles_.empty()) {
        visibleFrom_ = 0;
        visibleTo_ = 0;
        return;
    }
    visibleFrom_ = 0;
    visibleTo_ = candles_.size() - 1;
}

void RenderSurface::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    ++resizeEpoch_;
    resizeTimer_.cancel();
    pendingSize_.reset();
    resizeDue_ = false;
    const std::size_t released = series_.size();
    series_.clear();
    margins_.clear();
    candles_.clear();
    volume_.clear();
    LOG_DEBUG(logging::LogCategory::RENDER, "RenderSurface disposed, released %zu series", released);
}

const std::vector<SeriesPoint>* RenderSurface::seriesData(SeriesHandle handle) const {
    auto it = series_.find(handle);
    return it == series_.end() ? nullptr : &it->second.points;
}

const SeriesOptions* RenderSurface::seriesOptions(SeriesHandle handle) const {
    auto it = series_.find(handle);
    return it == series_.end() ? nullptr : &it->second.options;
}

std::optional<ScaleMargins> RenderSurface::scaleMargins(const std::string& scaleId) const {
    auto it = margins_.find(scaleId);
    if (it == margins_.end()) {
        return std::nullopt;
    }
    return it->second;
}

RenderSurface::Band RenderSurface::bandFor_(const std::string& scaleId, float plotHeight) const {
    ScaleMargins m{};
    if (auto it = margins_.find(scaleId); it != margins_.end()) {
        m = it->second;
    }
    return Band{static_cast<float>(m.top) * plotHeight, static_cast<float>(1.0 - m.bottom) * plotHeight};
}

float RenderSurface::xForIndex_(std::size_t index, float plotWidth) const {
    const std::size_t bars = visibleTo_ - visibleFrom_ + 1;
    const float spacing = plotWidth / static_cast<float>(bars);
    return (static_cast<float>(index) - static_cast<float>(visibleFrom_) + 0.5f) * spacing;
}

std::optional<std::size_t> RenderSurface::indexForTime_(domain::TimestampSec time) const {
    auto it = std::lower_bound(candles_.begin(), candles_.end(), time,
                               [](const domain::Candle& c, domain::TimestampSec t) { return c.time < t; });
    if (it == candles_.end() || it->time != time) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - candles_.begin());
}

void RenderSurface::draw(sf::RenderTarget& target, const sf::Font* font, sf::Vector2f origin) const {
    if (disposed_ || size_.width == 0 || size_.height == 0) {
        return;
    }
    const float plotW = std::max(1.f, static_cast<float>(size_.width) - kPriceAxisWidth);
    const float plotH = std::max(1.f, static_cast<float>(size_.height) - kTimeAxisHeight);

    sf::RectangleShape background({static_cast<float>(size_.width), static_cast<float>(size_.height)});
    background.setPosition(origin);
    background.setFillColor(palette::kBackground);
    target.draw(background);

    if (candles_.empty()) {
        return;
    }

    drawGrid_(target, font, origin, plotW, plotH);
    drawVolume_(target, origin, plotW, plotH);
    // Histograms first so lines stay on top.
    for (const auto& entry : series_) {
        if (entry.second.options.style == SeriesStyle::Histogram) {
            drawSeries_(target, font, origin, plotW, plotH, entry.second);
        }
    }
    drawCandles_(target, origin, plotW, plotH);
    for (const auto& entry : series_) {
        if (entry.second.options.style == SeriesStyle::Line) {
            drawSeries_(target, font, origin, plotW, plotH, entry.second);
        }
    }
}

void RenderSurface::drawGrid_(sf::RenderTarget& target,
                              const sf::Font* font,
                              sf::Vector2f origin,
                              float plotW,
                              float plotH) const {
    ValueRange range;
    for (std::size_t i = visibleFrom_; i <= visibleTo_; ++i) {
        range.include(candles_[i].low);
        range.include(candles_[i].high);
    }
    range.widenIfFlat();
    const Band band = bandFor_(kPriceScale, plotH);

    sf::VertexArray lines(sf::Lines);
    for (int i = 0; i <= kPriceGridLines; ++i) {
        const double value = range.lo + (range.hi - range.lo) * i / kPriceGridLines;
        const float y = origin.y + mapY(value, range, band.top, band.bottom);
        lines.append(sf::Vertex({origin.x, y}, palette::kGrid));
        lines.append(sf::Vertex({origin.x + plotW, y}, palette::kGrid));
        drawLabel(target, font, formatValue(value), {origin.x + plotW + 6.f, y - 7.f}, palette::kText);
    }

    const std::size_t bars = visibleTo_ - visibleFrom_ + 1;
    const float spacing = plotW / static_cast<float>(bars);
    const std::size_t step = std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(kMinTimeLabelSpacing / spacing)));
    const bool intraday = bars > 1 && (candles_[visibleTo_].time - candles_[visibleFrom_].time) /
                                              static_cast<domain::TimestampSec>(bars - 1) < 86400;
    for (std::size_t i = visibleFrom_; i <= visibleTo_; i += step) {
        const float x = origin.x + xForIndex_(i, plotW);
        lines.append(sf::Vertex({x, origin.y}, palette::kGrid));
        lines.append(sf::Vertex({x, origin.y + plotH}, palette::kGrid));
        drawLabel(target, font, formatTime(candles_[i].time, intraday), {x - 30.f, origin.y + plotH + 4.f},
                  palette::kText);
    }
    target.draw(lines);
}

void RenderSurface::drawVolume_(sf::RenderTarget& target, sf::Vector2f origin, float plotW, float plotH) const {
    ValueRange range;
    range.include(0.0);
    for (std::size_t i = visibleFrom_; i <= visibleTo_ && i < volume_.size(); ++i) {
        range.include(volume_[i].value);
    }
    range.widenIfFlat();
    const Band band = bandFor_(kVolumeScale, plotH);
    const float spacing = plotW / static_cast<float>(visibleTo_ - visibleFrom_ + 1);
    const float halfWidth = std::max(0.5f, spacing * kBodyWidthRatio * 0.5f);
    const float base = origin.y + mapY(0.0, range, band.top, band.bottom);

    sf::VertexArray bars(sf::Quads);
    for (std::size_t i = visibleFrom_; i <= visibleTo_ && i < volume_.size(); ++i) {
        const float x = origin.x + xForIndex_(i, plotW);
        const float y = origin.y + mapY(volume_[i].value, range, band.top, band.bottom);
        const sf::Color color = volume_[i].color.value_or(palette::kVolumeUp);
        bars.append(sf::Vertex({x - halfWidth, y}, color));
        bars.append(sf::Vertex({x + halfWidth, y}, color));
        bars.append(sf::Vertex({x + halfWidth, base}, color));
        bars.append(sf::Vertex({x - halfWidth, base}, color));
    }
    target.draw(bars);
}

void RenderSurface::drawCandles_(sf::RenderTarget& target, sf::Vector2f origin, float plotW, float plotH) const {
    ValueRange range;
    for (std::size_t i = visibleFrom_; i <= visibleTo_; ++i) {
        range.include(candles_[i].low);
        range.include(candles_[i].high);
    }
    for (const auto& entry : series_) {
        if (entry.second.options.scaleId != kPriceScale) {
            continue;
        }
        for (const auto& p : entry.second.points) {
            range.include(p.value);
        }
    }
    range.widenIfFlat();
    const Band band = bandFor_(kPriceScale, plotH);
    const float spacing = plotW / static_cast<float>(visibleTo_ - visibleFrom_ + 1);
    const float halfBody = std::max(0.5f, spacing * kBodyWidthRatio * 0.5f);

    sf::VertexArray wicks(sf::Lines);
    sf::VertexArray bodies(sf::Quads);
    for (std::size_t i = visibleFrom_; i <= visibleTo_; ++i) {
        const auto& c = candles_[i];
        const sf::Color color = c.bullish() ? palette::kUp : palette::kDown;
        const float x = origin.x + xForIndex_(i, plotW);
        wicks.append(sf::Vertex({x, origin.y + mapY(c.high, range, band.top, band.bottom)}, color));
        wicks.append(sf::Vertex({x, origin.y + mapY(c.low, range, band.top, band.bottom)}, color));

        float top = origin.y + mapY(std::max(c.open, c.close), range, band.top, band.bottom);
        float bottom = origin.y + mapY(std::min(c.open, c.close), range, band.top, band.bottom);
        if (bottom - top < 1.f) {
            bottom = top + 1.f;
        }
        bodies.append(sf::Vertex({x - halfBody, top}, color));
        bodies.append(sf::Vertex({x + halfBody, top}, color));
        bodies.append(sf::Vertex({x + halfBody, bottom}, color));
        bodies.append(sf::Vertex({x - halfBody, bottom}, color));
    }
    target.draw(wicks);
    target.draw(bodies);
}

void RenderSurface::drawSeries_(sf::RenderTarget& target,
                                const sf::Font* font,
                                sf::Vector2f origin,
                                float plotW,
                                float plotH,
                                const SeriesEntry& entry) const {
    if (entry.points.empty()) {
        return;
    }
    const std::string& scaleId = entry.options.scaleId;

    // Overlays share the candle range; every other scale fits its own series.
    ValueRange range;
    if (scaleId == kPriceScale) {
        for (std::size_t i = visibleFrom_; i <= visibleTo_; ++i) {
            range.include(candles_[i].low);
            range.include(candles_[i].high);
        }
    }
    for (const auto& other : series_) {
        if (other.second.options.scaleId != scaleId) {
            continue;
        }
        for (const auto& p : other.second.points) {
            auto idx = indexForTime_(p.time);
            if (idx && *idx >= visibleFrom_ && *idx <= visibleTo_) {
                range.include(p.value);
            }
        }
        if (other.second.options.style == SeriesStyle::Histogram) {
            range.include(0.0);
        }
    }
    if (!range.valid()) {
        return;
    }
    range.widenIfFlat();
    const Band band = bandFor_(scaleId, plotH);

    if (entry.options.style == SeriesStyle::Histogram) {
        const float spacing = plotW / static_cast<float>(visibleTo_ - visibleFrom_ + 1);
        const float halfWidth = std::max(0.5f, spacing * kBodyWidthRatio * 0.5f);
        const float base = origin.y + mapY(0.0, range, band.top, band.bottom);
        sf::VertexArray bars(sf::Quads);
        for (const auto& p : entry.points) {
            auto idx = indexForTime_(p.time);
            if (!idx || *idx < visibleFrom_ || *idx > visibleTo_) {
                continue;
            }
            const float x = origin.x + xForIndex_(*idx, plotW);
            const float y = origin.y + mapY(p.value, range, band.top, band.bottom);
            const sf::Color color = p.color.value_or(entry.options.color);
            bars.append(sf::Vertex({x - halfWidth, y}, color));
            bars.append(sf::Vertex({x + halfWidth, y}, color));
            bars.append(sf::Vertex({x + halfWidth, base}, color));
            bars.append(sf::Vertex({x - halfWidth, base}, color));
        }
        target.draw(bars);
    }
    else {
        sf::VertexArray strip(sf::LineStrip);
        for (const auto& p : entry.points) {
            auto idx = indexForTime_(p.time);
            if (!idx || *idx < visibleFrom_ || *idx > visibleTo_) {
                continue;
            }
            strip.append(sf::Vertex({origin.x + xForIndex_(*idx, plotW),
                                     origin.y + mapY(p.value, range, band.top, band.bottom)},
                                    p.color.value_or(entry.options.color)));
        }
        target.draw(strip);
    }

    const SeriesPoint& last = entry.points.back();
    const float y = origin.y + mapY(last.value, range, band.top, band.bottom);
    drawLabel(target, font, formatValue(last.value), {origin.x + plotW + 6.f, y - 7.f}, palette::kTextBright,
              entry.options.color);
}

}  // namespace ui
