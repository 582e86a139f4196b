#pragma once

#include "time_series.h"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace signalflow {

enum class PivotKind {
    High,
    Low
};

/// Flags local extrema of an oscillator.
///
/// Index i is examined only when i >= left and i + right < series.size().
/// A high pivot needs series[i] >= every other value in series[i-left..i]
/// and series[i] > every value in series[i+1..i+right]; a low pivot mirrors
/// this with <= and <. The forward side is strict so a plateau is credited
/// to its last bar.
///
/// @return one entry per input index; the pivot value where marked, empty
///         otherwise. A series too short for the windows is all empty.
std::vector<std::optional<double>> detect_pivots(std::span<const double> series,
                                                 std::size_t left,
                                                 std::size_t right,
                                                 PivotKind kind);

inline std::vector<std::optional<double>> detect_pivots(const TimeSeries& series,
                                                        std::size_t left,
                                                        std::size_t right,
                                                        PivotKind kind) {
    return detect_pivots(series.view(), left, right, kind);
}

} // namespace signalflow
