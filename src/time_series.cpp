#include "signalflow/time_series.h"

#include <numeric>

namespace signalflow {

bool TimeSeries::validate(std::string* error) const {
    if (timestamps.size() != values.size()) {
        if (error) {
            *error = "Timestamp count " + std::to_string(timestamps.size()) +
                     " does not match value count " + std::to_string(values.size());
        }
        return false;
    }
    for (std::size_t i = 1; i < timestamps.size(); ++i) {
        if (timestamps[i] <= timestamps[i - 1]) {
            if (error) {
                *error = "Timestamps not strictly increasing at row " + std::to_string(i);
            }
            return false;
        }
    }
    if (error) {
        error->clear();
    }
    return true;
}

TimeSeries TimeSeries::from_values(std::vector<double> values) {
    std::vector<int64_t> ts(values.size());
    std::iota(ts.begin(), ts.end(), int64_t{0});
    return TimeSeries(std::move(ts), std::move(values));
}

} // namespace signalflow
