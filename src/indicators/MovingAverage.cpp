#include "indicators/MovingAverage.h"

#include <cmath>
#include <limits>

namespace indicators::ma {
namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

double smoothingFactor(int period) {
    if (period <= 0) {
        return 0.0;
    }
    return 2.0 / (static_cast<double>(period) + 1.0);
}

std::size_t firstValid(const std::vector<double>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i])) {
            return i;
        }
    }
    return values.size();
}

std::vector<double> sma(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), kNaN);
    if (period <= 0) {
        return out;
    }
    const std::size_t window = static_cast<std::size_t>(period);
    const std::size_t start = firstValid(values);
    if (values.size() < start + window) {
        return out;
    }

    double sum = 0.0;
    for (std::size_t i = start; i < values.size(); ++i) {
        sum += values[i];
        if (i >= start + window) {
            sum -= values[i - window];
        }
        if (i + 1 >= start + window) {
            out[i] = sum / static_cast<double>(window);
        }
    }
    return out;
}

std::vector<double> ema(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), kNaN);
    if (period <= 0) {
        return out;
    }
    const std::size_t window = static_cast<std::size_t>(period);
    const std::size_t start = firstValid(values);
    if (values.size() < start + window) {
        return out;
    }

    double sum = 0.0;
    for (std::size_t i = start; i < start + window; ++i) {
        sum += values[i];
    }
    double ema = sum / static_cast<double>(window);
    out[start + window - 1] = ema;

    const double alpha = smoothingFactor(period);
    for (std::size_t i = start + window; i < values.size(); ++i) {
        ema = (values[i] - ema) * alpha + ema;
        out[i] = ema;
    }
    return out;
}

}  // namespace indicators::ma
