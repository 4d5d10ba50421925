#include "indicators/IndicatorEngine.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include "domain/Errors.h"
#include "indicators/MovingAverage.h"
#include "indicators/Oscillators.h"
#include "logging/Log.h"

namespace indicators {
namespace {

constexpr int kStochSmoothing = 3;

using Params = std::vector<int>;
using FullSeries = std::vector<ValueSeries>;
using ComputeFn = FullSeries (*)(const std::vector<double>&, const Params&);
using WarmupFn = std::size_t (*)(const Params&);

FullSeries computeSma(const std::vector<double>& closes, const Params& p) {
    return {ma::sma(closes, p[0])};
}

FullSeries computeEma(const std::vector<double>& closes, const Params& p) {
    return {ma::ema(closes, p[0])};
}

FullSeries computeRsi(const std::vector<double>& closes, const Params& p) {
    return {osc::rsi(closes, p[0])};
}

FullSeries computeMacd(const std::vector<double>& closes, const Params& p) {
    const auto fast = ma::ema(closes, p[0]);
    const auto slow = ma::ema(closes, p[1]);
    ValueSeries line(closes.size(), std::nan(""));
    for (std::size_t i = 0; i < closes.size(); ++i) {
        if (std::isfinite(fast[i]) && std::isfinite(slow[i])) {
            line[i] = fast[i] - slow[i];
        }
    }
    auto signal = ma::ema(line, p[2]);
    ValueSeries histogram(closes.size(), std::nan(""));
    for (std::size_t i = 0; i < closes.size(); ++i) {
        if (std::isfinite(signal[i])) {
            histogram[i] = line[i] - signal[i];
        }
    }
    return {std::move(line), std::move(signal), std::move(histogram)};
}

FullSeries computeStochRsi(const std::vector<double>& closes, const Params& p) {
    const auto rsi = osc::rsi(closes, p[0]);
    const auto stoch = osc::stochastic(rsi, p[1]);
    auto k = ma::sma(stoch, kStochSmoothing);
    auto d = ma::sma(k, kStochSmoothing);
    return {std::move(k), std::move(d)};
}

std::size_t warmupPeriodMinusOne(const Params& p) {
    return static_cast<std::size_t>(p[0]) - 1;
}

std::size_t warmupRsi(const Params& p) {
    return static_cast<std::size_t>(p[0]);
}

std::size_t warmupMacd(const Params& p) {
    return static_cast<std::size_t>(p[1]) + static_cast<std::size_t>(p[2]) - 2;
}

std::size_t warmupStochRsi(const Params& p) {
    return static_cast<std::size_t>(p[0]) + static_cast<std::size_t>(p[1]) - 1 +
           2 * static_cast<std::size_t>(kStochSmoothing - 1);
}

struct Strategy {
    StrategyTraits traits;
    WarmupFn warmup;
    ComputeFn compute;
};

// Indexed by IndicatorKind.
const std::array<Strategy, 5> kStrategies{{
    {{IndicatorKind::SMA, "SMA", 1, 1, true, {"SMA", nullptr, nullptr}}, &warmupPeriodMinusOne, &computeSma},
    {{IndicatorKind::EMA, "EMA", 1, 1, true, {"EMA", nullptr, nullptr}}, &warmupPeriodMinusOne, &computeEma},
    {{IndicatorKind::RSI, "RSI", 1, 1, false, {"RSI", nullptr, nullptr}}, &warmupRsi, &computeRsi},
    {{IndicatorKind::MACD, "MACD", 3, 3, false, {"MACD", "Signal", "Histogram"}}, &warmupMacd, &computeMacd},
    {{IndicatorKind::StochRSI, "StochRSI", 2, 2, false, {"%K", "%D", nullptr}}, &warmupStochRsi, &computeStochRsi},
}};

const Strategy& strategyFor(IndicatorKind kind) {
    return kStrategies[static_cast<std::size_t>(kind)];
}

}  // namespace

const StrategyTraits& IndicatorEngine::traits(IndicatorKind kind) {
    return strategyFor(kind).traits;
}

std::size_t IndicatorEngine::seriesCountFor(IndicatorKind kind) {
    return strategyFor(kind).traits.seriesCount;
}

void IndicatorEngine::validate(const IndicatorSpec& spec) {
    const auto& t = traits(spec.kind);
    if (spec.params.size() != t.paramCount) {
        throw domain::ConfigError(std::string(t.name) + " expects " + std::to_string(t.paramCount) +
                                  " parameter(s), got " + std::to_string(spec.params.size()));
    }
    for (std::size_t i = 0; i < spec.params.size(); ++i) {
        if (spec.params[i] <= 0) {
            throw domain::ConfigError(std::string(t.name) + " parameter " + std::to_string(i + 1) +
                                      " must be positive, got " + std::to_string(spec.params[i]));
        }
    }
    if (spec.kind == IndicatorKind::MACD && spec.params[0] >= spec.params[1]) {
        throw domain::ConfigError("MACD fast period (" + std::to_string(spec.params[0]) +
                                  ") must be smaller than slow period (" + std::to_string(spec.params[1]) + ")");
    }
}

std::size_t IndicatorEngine::warmup(const IndicatorSpec& spec) {
    return strategyFor(spec.kind).warmup(spec.params);
}

IndicatorOutput IndicatorEngine::compute(const std::vector<double>& closes, const IndicatorSpec& spec) {
    validate(spec);
    const Strategy& strategy = strategyFor(spec.kind);

    IndicatorOutput output;
    output.warmup = strategy.warmup(spec.params);
    output.series.resize(strategy.traits.seriesCount);
    if (closes.size() <= output.warmup) {
        LOG_DEBUG(logging::LogCategory::INDICATOR,
                  "%s: %zu closes within warm-up of %zu, no output",
                  spec.label().c_str(),
                  closes.size(),
                  output.warmup);
        return output;
    }

    FullSeries full = strategy.compute(closes, spec.params);
    if (full.size() != strategy.traits.seriesCount) {
        throw domain::ComputeError(spec.label() + ": strategy produced " + std::to_string(full.size()) +
                                   " series, expected " + std::to_string(strategy.traits.seriesCount));
    }

    const auto first = static_cast<std::ptrdiff_t>(output.warmup);
    for (std::size_t s = 0; s < full.size(); ++s) {
        const ValueSeries& src = full[s];
        for (std::size_t i = output.warmup; i < src.size(); ++i) {
            if (!std::isfinite(src[i])) {
                throw domain::ComputeError(spec.label() + ": non-finite " + strategy.traits.seriesNames[s] +
                                           " value at index " + std::to_string(i));
            }
        }
        output.series[s].assign(src.begin() + first, src.end());
    }
    return output;
}

std::vector<TimedValue> IndicatorEngine::align(const std::vector<domain::Candle>& candles,
                                               const ValueSeries& values) {
    std::vector<TimedValue> points;
    if (values.size() > candles.size()) {
        LOG_WARN(logging::LogCategory::INDICATOR,
                 "align: %zu values for %zu candles, dropping the oldest surplus",
                 values.size(),
                 candles.size());
    }
    const std::size_t count = std::min(values.size(), candles.size());
    points.resize(count);
    for (std::size_t k = 0; k < count; ++k) {
        const domain::Candle& candle = candles[candles.size() - 1 - k];
        points[count - 1 - k] = TimedValue{candle.time, values[values.size() - 1 - k]};
    }
    return points;
}

}  // namespace indicators
