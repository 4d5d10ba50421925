#include "app/PaneAllocator.h"

#include "indicators/IndicatorEngine.h"
#include "logging/Log.h"

namespace app {

PaneAllocator::PaneAllocator(ui::RenderSurface& surface) : surface_(surface) {}

std::string PaneAllocator::paneIdFor(std::uint64_t instanceId) {
    return "pane_" + std::to_string(instanceId);
}

Placement PaneAllocator::allocate(std::uint64_t instanceId, indicators::IndicatorKind kind) {
    Placement placement;
    if (indicators::IndicatorEngine::traits(kind).overlay) {
        placement.kind = PlacementKind::Overlay;
        placement.scaleId = ui::RenderSurface::kPriceScale;
        return placement;
    }

    placement.kind = PlacementKind::Oscillator;
    placement.scaleId = paneIdFor(instanceId);
    if (!panes_.insert(placement.scaleId).second) {
        LOG_WARN(logging::LogCategory::RENDER, "pane %s allocated twice", placement.scaleId.c_str());
    }
    LOG_DEBUG(logging::LogCategory::RENDER,
              "allocated %s for %s (%zu panes active)",
              placement.scaleId.c_str(),
              indicators::kind_name(kind),
              panes_.size());
    return placement;
}

void PaneAllocator::configure(const Placement& placement) {
    if (placement.overlay()) {
        return;
    }
    surface_.applyScaleMargins(placement.scaleId, ui::ScaleMargins{kOscillatorTopMargin, kOscillatorBottomMargin});
}

void PaneAllocator::release(const Placement& placement) {
    if (placement.overlay()) {
        return;
    }
    if (panes_.erase(placement.scaleId) == 0) {
        LOG_DEBUG(logging::LogCategory::RENDER, "release of unknown pane %s", placement.scaleId.c_str());
        return;
    }
    LOG_DEBUG(logging::LogCategory::RENDER, "released %s", placement.scaleId.c_str());
}

}  // namespace app
