#include "signalflow/pivot_detector.h"

namespace signalflow {

namespace {

bool is_pivot(std::span<const double> series, std::size_t i,
              std::size_t left, std::size_t right, PivotKind kind) {
    const double ref = series[i];
    if (kind == PivotKind::High) {
        for (std::size_t j = i - left; j < i; ++j) {
            if (!(ref >= series[j])) return false;
        }
        for (std::size_t j = i + 1; j <= i + right; ++j) {
            if (!(ref > series[j])) return false;
        }
        return true;
    }

    for (std::size_t j = i - left; j < i; ++j) {
        if (!(ref <= series[j])) return false;
    }
    for (std::size_t j = i + 1; j <= i + right; ++j) {
        if (!(ref < series[j])) return false;
    }
    return true;
}

} // namespace

std::vector<std::optional<double>> detect_pivots(std::span<const double> series,
                                                 std::size_t left,
                                                 std::size_t right,
                                                 PivotKind kind) {
    const std::size_t n = series.size();
    std::vector<std::optional<double>> pivots(n);
    // Written without left + right so huge windows cannot wrap.
    if (left >= n || right >= n - left) {
        return pivots;
    }

    for (std::size_t i = left; i < n - right; ++i) {
        if (is_pivot(series, i, left, right, kind)) {
            pivots[i] = series[i];
        }
    }
    return pivots;
}

} // namespace signalflow
