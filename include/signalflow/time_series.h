#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace signalflow {

// Ordered (timestamp, value) pairs. Timestamps are unix seconds and must be
// strictly increasing.
struct TimeSeries {
    std::vector<int64_t> timestamps;
    std::vector<double> values;

    TimeSeries() = default;
    TimeSeries(std::vector<int64_t> ts, std::vector<double> vals)
        : timestamps(std::move(ts)), values(std::move(vals)) {}

    std::size_t size() const noexcept { return values.size(); }
    bool empty() const noexcept { return values.empty(); }

    std::span<const double> view() const noexcept { return values; }

    // Returns false and fills `error` when lengths differ or timestamps are
    // not strictly increasing.
    bool validate(std::string* error = nullptr) const;

    // Series whose timestamps are 0..n-1. Handy for index-only callers.
    static TimeSeries from_values(std::vector<double> values);
};

} // namespace signalflow
