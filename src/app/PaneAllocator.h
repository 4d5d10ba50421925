#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "indicators/IndicatorTypes.h"
#include "ui/RenderSurface.h"

namespace app {

enum class PlacementKind { Overlay, Oscillator };

struct Placement {
    PlacementKind kind{PlacementKind::Overlay};
    // Scale the instance's series are attached to: the price scale for overlays, "pane_<id>" otherwise.
    std::string scaleId{ui::RenderSurface::kPriceScale};

    bool overlay() const { return kind == PlacementKind::Overlay; }
};

// Decides where an indicator instance draws. Every oscillator instance gets a scale of its own,
// configured to the bottom band of the chart; panes are never shared.
class PaneAllocator {
public:
    static constexpr double kOscillatorTopMargin = 0.8;
    static constexpr double kOscillatorBottomMargin = 0.0;

    explicit PaneAllocator(ui::RenderSurface& surface);

    Placement allocate(std::uint64_t instanceId, indicators::IndicatorKind kind);

    // Pushes the pane's margins to the surface; call after the pane's series exist.
    void configure(const Placement& placement);

    void release(const Placement& placement);

    const std::set<std::string>& activePanes() const noexcept { return panes_; }

    static std::string paneIdFor(std::uint64_t instanceId);

private:
    ui::RenderSurface& surface_;
    std::set<std::string> panes_;
};

}  // namespace app
