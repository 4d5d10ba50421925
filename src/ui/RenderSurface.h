#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/System/Vector2.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "domain/Types.h"

namespace ui {

using SeriesHandle = std::uint64_t;

enum class SeriesStyle { Line, Histogram };

// Fractions of the plot height left empty above and below a scale's band.
struct ScaleMargins {
    double top{0.0};
    double bottom{0.0};

    bool operator==(const ScaleMargins& o) const { return top == o.top && bottom == o.bottom; }
};

struct SeriesPoint {
    domain::TimestampSec time{0};
    double value{0.0};
    std::optional<sf::Color> color{};
};

struct SeriesOptions {
    SeriesStyle style{SeriesStyle::Line};
    std::string scaleId{"right"};
    sf::Color color{sf::Color::White};
    float lineWidth{1.5f};
    std::string title{};
};

struct SurfaceSize {
    unsigned width{0};
    unsigned height{0};

    bool operator==(const SurfaceSize& o) const { return width == o.width && height == o.height; }
    bool operator!=(const SurfaceSize& o) const { return !(*this == o); }
};

// Owns the chart: the persistent candle and volume series plus every dynamic series handle.
// Callers hold only SeriesHandle values and release them through removeSeries().
class RenderSurface {
public:
    static constexpr const char* kPriceScale = "right";
    static constexpr const char* kVolumeScale = "";

    // Marks a data push in progress. A resize that comes due inside the guard is applied when the
    // outermost guard closes.
    class DataPushGuard {
    public:
        explicit DataPushGuard(RenderSurface& surface);
        ~DataPushGuard();

        DataPushGuard(const DataPushGuard&) = delete;
        DataPushGuard& operator=(const DataPushGuard&) = delete;

    private:
        RenderSurface& surface_;
    };

    RenderSurface(boost::asio::io_context& ioc, std::chrono::milliseconds resizeDebounce, SurfaceSize initial);
    ~RenderSurface();

    RenderSurface(const RenderSurface&) = delete;
    RenderSurface& operator=(const RenderSurface&) = delete;

    // Returns 0 once the surface is disposed.
    SeriesHandle addSeries(const SeriesOptions& options);
    bool removeSeries(SeriesHandle handle);
    void setSeriesData(SeriesHandle handle, std::vector<SeriesPoint> points);

    // Replaces the base candles and the per-candle colored volume bars.
    void setCandles(const std::vector<domain::Candle>& candles);

    void applyScaleMargins(const std::string& scaleId, ScaleMargins margins);

    // Debounced; only the latest size is applied. Zero-sized requests are ignored.
    void requestResize(SurfaceSize size);

    // Shows the full candle range.
    void fitContent();

    void draw(sf::RenderTarget& target, const sf::Font* font, sf::Vector2f origin = {0.f, 0.f}) const;

    void dispose();

    bool disposed() const noexcept { return disposed_; }
    SurfaceSize size() const noexcept { return size_; }
    std::size_t seriesCount() const noexcept { return series_.size(); }
    bool hasSeries(SeriesHandle handle) const { return series_.count(handle) != 0; }
    const std::vector<SeriesPoint>* seriesData(SeriesHandle handle) const;
    const SeriesOptions* seriesOptions(SeriesHandle handle) const;
    std::optional<ScaleMargins> scaleMargins(const std::string& scaleId) const;
    std::size_t candleCount() const noexcept { return candles_.size(); }
    const std::vector<SeriesPoint>& volume() const noexcept { return volume_; }
    std::size_t appliedResizes() const noexcept { return appliedResizes_; }
    bool resizePending() const noexcept { return pendingSize_.has_value(); }
    bool pushInProgress() const noexcept { return pushDepth_ > 0; }
    // Indices into the candle array, inclusive.
    std::pair<std::size_t, std::size_t> visibleRange() const noexcept { return {visibleFrom_, visibleTo_}; }

private:
    struct SeriesEntry {
        SeriesOptions options;
        std::vector<SeriesPoint> points;
    };

    struct Band {
        float top{0.f};
        float bottom{0.f};
    };

    void beginPush_();
    void endPush_();
    void onResizeTimer_(const boost::system::error_code& ec, std::uint64_t epoch);
    void applyPendingSize_();

    Band bandFor_(const std::string& scaleId, float plotHeight) const;
    float xForIndex_(std::size_t index, float plotWidth) const;
    std::optional<std::size_t> indexForTime_(domain::TimestampSec time) const;

    void drawGrid_(sf::RenderTarget& target, const sf::Font* font, sf::Vector2f origin, float plotW, float plotH) const;
    void drawVolume_(sf::RenderTarget& target, sf::Vector2f origin, float plotW, float plotH) const;
    void drawCandles_(sf::RenderTarget& target, sf::Vector2f origin, float plotW, float plotH) const;
    void drawSeries_(sf::RenderTarget& target,
                     const sf::Font* font,
                     sf::Vector2f origin,
                     float plotW,
                     float plotH,
                     const SeriesEntry& entry) const;

    boost::asio::steady_timer resizeTimer_;
    std::chrono::milliseconds resizeDebounce_;
    SurfaceSize size_;
    std::optional<SurfaceSize> pendingSize_;
    bool resizeDue_{false};
    std::uint64_t resizeEpoch_{0};
    std::size_t appliedResizes_{0};
    int pushDepth_{0};
    bool disposed_{false};

    std::vector<domain::Candle> candles_;
    std::vector<SeriesPoint> volume_;
    std::map<SeriesHandle, SeriesEntry> series_;
    std::map<std::string, ScaleMargins> margins_;
    SeriesHandle nextHandle_{1};
    std::size_t visibleFrom_{0};
    std::size_t visibleTo_{0};
};

}  // namespace ui
