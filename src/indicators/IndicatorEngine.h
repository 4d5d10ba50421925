#pragma once

#include <cstddef>
#include <vector>

#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"

namespace indicators {

struct StrategyTraits {
    IndicatorKind kind;
    const char* name;
    std::size_t paramCount;
    std::size_t seriesCount;
    // Overlay strategies share the price scale; the rest get an oscillator pane.
    bool overlay;
    const char* seriesNames[3];
};

// Pure indicator computation. Strategies are looked up by kind in a static table; there is no
// per-call or per-instance state.
class IndicatorEngine {
public:
    static const StrategyTraits& traits(IndicatorKind kind);
    static std::size_t seriesCountFor(IndicatorKind kind);

    // Throws domain::ConfigError: wrong parameter count, non-positive period, MACD fast >= slow.
    static void validate(const IndicatorSpec& spec);

    // Number of leading closes that receive no output. Assumes a validated spec.
    static std::size_t warmup(const IndicatorSpec& spec);

    // Validates, then computes. Output series have length N - warmup (empty when N <= warmup).
    // Throws domain::ConfigError for bad params and domain::ComputeError for non-finite results.
    static IndicatorOutput compute(const std::vector<double>& closes, const IndicatorSpec& spec);

    // Pairs values right-to-left with candles: the last value gets the last candle's time.
    static std::vector<TimedValue> align(const std::vector<domain::Candle>& candles, const ValueSeries& values);
};

}  // namespace indicators
