#include "indicators/Oscillators.h"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <limits>

#include "indicators/MovingAverage.h"

namespace indicators::osc {
namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double rsiFromAverages(double avgGain, double avgLoss) {
    if (avgLoss == 0.0) {
        return 100.0;
    }
    if (avgGain == 0.0) {
        return 0.0;
    }
    const double rs = avgGain / avgLoss;
    return 100.0 - 100.0 / (1.0 + rs);
}
}  // namespace

std::vector<double> rsi(const std::vector<double>& closes, int period) {
    std::vector<double> out(closes.size(), kNaN);
    if (period <= 0 || closes.size() <= static_cast<std::size_t>(period)) {
        return out;
    }
    const std::size_t p = static_cast<std::size_t>(period);

    double gainSum = 0.0;
    double lossSum = 0.0;
    for (std::size_t i = 1; i <= p; ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0.0) {
            gainSum += change;
        }
        else {
            lossSum -= change;
        }
    }
    double avgGain = gainSum / static_cast<double>(p);
    double avgLoss = lossSum / static_cast<double>(p);
    out[p] = rsiFromAverages(avgGain, avgLoss);

    const double keep = static_cast<double>(p - 1);
    for (std::size_t i = p + 1; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;
        avgGain = (avgGain * keep + gain) / static_cast<double>(p);
        avgLoss = (avgLoss * keep + loss) / static_cast<double>(p);
        out[i] = rsiFromAverages(avgGain, avgLoss);
    }
    return out;
}

std::vector<double> stochastic(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), kNaN);
    if (period <= 0) {
        return out;
    }
    const std::size_t window = static_cast<std::size_t>(period);
    const std::size_t start = ma::firstValid(values);
    if (values.size() < start + window) {
        return out;
    }

    for (std::size_t i = start + window - 1; i < values.size(); ++i) {
        const auto first = values.begin() + static_cast<std::ptrdiff_t>(i + 1 - window);
        const auto last = values.begin() + static_cast<std::ptrdiff_t>(i + 1);
        const auto [lo, hi] = std::minmax_element(first, last);
        const double range = *hi - *lo;
        out[i] = range > 0.0 ? 100.0 * (values[i] - *lo) / range : 0.0;
    }
    return out;
}

}  // namespace indicators::osc
