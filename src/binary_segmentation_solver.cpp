#include "signalflow/change_point.h"

#include <algorithm>
#include <stdexcept>

namespace signalflow {

BinarySegmentationSolver::BinarySegmentationSolver(BinarySegmentationConfig config)
    : m_config(config) {
    if (m_config.minSegmentLength < 1) {
        m_config.minSegmentLength = 1;
    }
    if (m_config.jump < 1) {
        throw std::invalid_argument("Binary segmentation requires a positive jump");
    }
    m_cost = make_segment_cost(m_config.model);
    m_config.minSegmentLength = std::max(m_config.minSegmentLength, m_cost->min_size());
}

void BinarySegmentationSolver::fit(std::span<const double> signal) {
    m_cost->fit(Eigen::Map<const Eigen::VectorXd>(signal.data(), static_cast<Eigen::Index>(signal.size())));
    m_numSamples = signal.size();
    m_fitted = true;
}

BinarySegmentationSolver::Split BinarySegmentationSolver::bestSplit(std::size_t start,
                                                                    std::size_t end) const {
    Split best;
    const std::size_t minLength = m_config.minSegmentLength;
    if (end - start < 2 * minLength) {
        return best;
    }

    const double whole = m_cost->error(start, end);
    const std::size_t jump = m_config.jump;
    std::size_t k = ((start + minLength + jump - 1) / jump) * jump;
    for (; k + minLength <= end; k += jump) {
        const double gain = whole - m_cost->error(start, k) - m_cost->error(k, end);
        if (!best.valid || gain > best.gain) {
            best.index = k;
            best.gain = gain;
            best.valid = true;
        }
    }
    return best;
}

std::vector<std::size_t> BinarySegmentationSolver::predict(double penalty) const {
    if (!m_fitted) {
        throw SegmentationError("Binary segmentation predict() called before fit()");
    }
    if (!(penalty >= 0.0)) {
        throw std::invalid_argument("Binary segmentation penalty must be non-negative");
    }
    const std::size_t n = m_numSamples;
    if (n < m_config.minSegmentLength) {
        throw SegmentationError("Series is too short for the requested minimum segment length");
    }

    std::vector<std::size_t> breakpoints{n};
    for (;;) {
        Split best;
        std::size_t start = 0;
        for (const std::size_t end : breakpoints) {
            Split candidate = bestSplit(start, end);
            if (candidate.valid && (!best.valid || candidate.gain > best.gain)) {
                best = candidate;
            }
            start = end;
        }
        if (!best.valid || !(best.gain > penalty)) {
            break;
        }
        breakpoints.insert(std::upper_bound(breakpoints.begin(), breakpoints.end(), best.index),
                           best.index);
    }
    return breakpoints;
}

SolverFactory binary_segmentation_factory(std::size_t minSegmentLength, std::size_t jump) {
    return [minSegmentLength, jump](CostModel model) -> std::unique_ptr<ChangePointSolver> {
        BinarySegmentationConfig config;
        config.model = model;
        config.minSegmentLength = minSegmentLength;
        config.jump = jump;
        return std::make_unique<BinarySegmentationSolver>(config);
    };
}

} // namespace signalflow
