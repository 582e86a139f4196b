#include "signalflow/change_point.h"
#include "signalflow/simple_logger.h"

#include <algorithm>
#include <cmath>

namespace signalflow {

ChangePointDetector::ChangePointDetector()
    : m_factory(pelt_solver_factory()) {}

ChangePointDetector::ChangePointDetector(SolverFactory factory)
    : m_factory(std::move(factory)) {
    if (!m_factory) {
        throw std::invalid_argument("ChangePointDetector requires a solver factory");
    }
}

std::vector<std::size_t> ChangePointDetector::detect_change_points(std::span<const double> series,
                                                                   double penalty,
                                                                   CostModel model) const {
    if (series.empty()) {
        return {};
    }
    const bool allFinite = std::all_of(series.begin(), series.end(),
                                       [](double v) { return std::isfinite(v); });
    if (!allFinite) {
        SimpleLogger::Warn("Change-point detection skipped: series contains non-finite values");
        return {};
    }

    std::vector<std::size_t> breakpoints;
    try {
        auto solver = m_factory(model);
        solver->fit(series);
        breakpoints = solver->predict(penalty);
    } catch (const SegmentationError& e) {
        SimpleLogger::Warn(std::string("Change-point detection returned no segmentation: ") + e.what());
        return {};
    }

    // Solvers report the series length as the end of the last segment.
    std::vector<std::size_t> indices;
    indices.reserve(breakpoints.size());
    for (const std::size_t index : breakpoints) {
        if (index < series.size()) {
            indices.push_back(index);
        }
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

} // namespace signalflow
