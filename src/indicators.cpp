#include "signalflow/indicators.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace signalflow {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Bias-adjusted exponential mean of `values` starting at `first`.
// Output is NaN until `minPeriods` observations have been seen.
std::vector<double> adjusted_ewm(const std::vector<double>& values, std::size_t first,
                                 double alpha, std::size_t minPeriods)
{
    std::vector<double> out(values.size(), kNaN);
    const double decay = 1.0 - alpha;

    double weightedSum = 0.0;
    double weightTotal = 0.0;
    std::size_t observations = 0;
    for (std::size_t i = first; i < values.size(); ++i) {
        weightedSum *= decay;
        weightTotal *= decay;
        if (!std::isnan(values[i])) {
            weightedSum += values[i];
            weightTotal += 1.0;
            ++observations;
        }
        if (observations >= minPeriods && weightTotal > 0.0) {
            out[i] = weightedSum / weightTotal;
        }
    }
    return out;
}

} // namespace

std::vector<double> ema(std::span<const double> values, std::size_t span)
{
    if (span == 0) {
        throw std::invalid_argument("EMA span must be >= 1");
    }

    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    std::vector<double> out(values.size(), kNaN);

    double previous = kNaN;
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double x = values[i];
        if (std::isnan(x)) {
            out[i] = previous;
            continue;
        }
        previous = std::isnan(previous) ? x : alpha * x + (1.0 - alpha) * previous;
        out[i] = previous;
    }
    return out;
}

MacdSeries macd(std::span<const double> close, std::size_t fastSpan, std::size_t slowSpan,
                std::size_t signalSpan)
{
    MacdSeries result;
    result.fast = ema(close, fastSpan);
    result.slow = ema(close, slowSpan);

    result.macd.resize(close.size());
    for (std::size_t i = 0; i < close.size(); ++i) {
        result.macd[i] = result.fast[i] - result.slow[i];
    }

    result.signal = ema(result.macd, signalSpan);

    result.histogram.resize(close.size());
    for (std::size_t i = 0; i < close.size(); ++i) {
        result.histogram[i] = result.macd[i] - result.signal[i];
    }
    return result;
}

std::vector<double> rsi(std::span<const double> close, std::size_t period)
{
    if (period == 0) {
        throw std::invalid_argument("RSI period must be >= 1");
    }

    const std::size_t n = close.size();
    std::vector<double> gains(n, kNaN);
    std::vector<double> losses(n, kNaN);
    for (std::size_t i = 1; i < n; ++i) {
        const double diff = close[i] - close[i - 1];
        if (std::isnan(diff)) {
            continue;
        }
        gains[i] = diff > 0.0 ? diff : 0.0;
        losses[i] = diff < 0.0 ? -diff : 0.0;
    }

    const double alpha = 1.0 / static_cast<double>(period);
    const auto avgGain = adjusted_ewm(gains, 1, alpha, period);
    const auto avgLoss = adjusted_ewm(losses, 1, alpha, period);

    // A zero average loss gives RS = inf and RSI = 100; 0/0 stays NaN.
    std::vector<double> out(n, kNaN);
    for (std::size_t i = 0; i < n; ++i) {
        const double rs = avgGain[i] / avgLoss[i];
        out[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return out;
}

} // namespace signalflow
