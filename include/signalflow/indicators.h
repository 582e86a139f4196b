#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace signalflow {

// Exponential moving average with alpha = 2 / (span + 1), seeded with the
// first value (no bias adjustment). NaN inputs repeat the previous output.
std::vector<double> ema(std::span<const double> values, std::size_t span);

struct MacdSeries {
    std::vector<double> fast;       // EMA12
    std::vector<double> slow;       // EMA26
    std::vector<double> macd;       // fast - slow
    std::vector<double> signal;     // EMA9 of macd
    std::vector<double> histogram;  // macd - signal
};

MacdSeries macd(std::span<const double> close,
                std::size_t fastSpan = 12,
                std::size_t slowSpan = 26,
                std::size_t signalSpan = 9);

// Relative strength index. Gains and losses of the first differences are
// smoothed with a bias-adjusted exponential mean, alpha = 1 / period. The
// first `period` values are NaN.
std::vector<double> rsi(std::span<const double> close, std::size_t period = 14);

} // namespace signalflow
