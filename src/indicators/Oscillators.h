#pragma once

#include <vector>

namespace indicators {

namespace osc {

// Wilder RSI in [0, 100]. First value at index `period`; earlier slots are NaN.
std::vector<double> rsi(const std::vector<double>& closes, int period);

// 100 * (x - min) / (max - min) over a trailing window of the finite values; 0 for a flat window.
std::vector<double> stochastic(const std::vector<double>& values, int period);

}  // namespace osc

}  // namespace indicators
