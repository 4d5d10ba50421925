#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Types.h"

namespace indicators {

enum class IndicatorKind { SMA, EMA, RSI, MACD, StochRSI };

const char* kind_name(IndicatorKind kind);
std::optional<IndicatorKind> kind_from_name(std::string_view name);

// Immutable once built. params are kept in the order the strategy documents them.
struct IndicatorSpec {
    IndicatorKind kind{IndicatorKind::SMA};
    std::vector<int> params{};

    // "SMA (20)", "MACD (12,26,9)"
    std::string label() const;

    bool operator==(const IndicatorSpec& o) const { return kind == o.kind && params == o.params; }
    bool operator!=(const IndicatorSpec& o) const { return !(*this == o); }
};

struct IndicatorSpecHash {
    std::size_t operator()(const IndicatorSpec& spec) const noexcept;
};

// "SMA:20", "MACD:12,26,9". Throws domain::ConfigError on syntax errors; parameter ranges are
// checked separately by IndicatorEngine::validate().
IndicatorSpec parse_spec(std::string_view text);

using ValueSeries = std::vector<double>;

// Output of one strategy. All series share one length, N - warmup for an input of N closes.
struct IndicatorOutput {
    std::vector<ValueSeries> series{};
    std::size_t warmup{0};

    std::size_t length() const noexcept { return series.empty() ? 0 : series.front().size(); }
    bool empty() const noexcept { return length() == 0; }
};

struct TimedValue {
    domain::TimestampSec time{0};
    double value{0.0};
};

}  // namespace indicators
