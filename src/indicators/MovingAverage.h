#pragma once

#include <cstddef>
#include <vector>

namespace indicators {

// Full-length kernels: the result has one slot per input value, NaN until the window fills.
namespace ma {

std::vector<double> sma(const std::vector<double>& values, int period);

// EMA seeded with the SMA of the first `period` valid values, alpha = 2 / (period + 1).
// Leading NaNs in the input are skipped, so the kernel can run on another indicator's output.
std::vector<double> ema(const std::vector<double>& values, int period);

double smoothingFactor(int period);

// Index of the first finite value, or values.size().
std::size_t firstValid(const std::vector<double>& values);

}  // namespace ma

}  // namespace indicators
