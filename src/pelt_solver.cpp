#include "signalflow/change_point.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>

namespace signalflow {

namespace {

// Best partition of signal[0, end): total penalised cost and the start of
// its last segment.
struct Partition {
    double cost = 0.0;
    std::size_t lastStart = 0;
};

} // namespace

PeltSolver::PeltSolver(PeltConfig config)
    : m_config(config) {
    if (m_config.minSize < 1) {
        throw std::invalid_argument("PELT requires a minimum segment size of at least 1");
    }
    if (m_config.jump < 1) {
        throw std::invalid_argument("PELT requires a positive jump");
    }
    m_cost = make_segment_cost(m_config.model);
    m_config.minSize = std::max(m_config.minSize, m_cost->min_size());
}

void PeltSolver::fit(std::span<const double> signal) {
    m_cost->fit(Eigen::Map<const Eigen::VectorXd>(signal.data(), static_cast<Eigen::Index>(signal.size())));
    m_numSamples = signal.size();
    m_fitted = true;
}

std::vector<std::size_t> PeltSolver::predict(double penalty) const {
    if (!m_fitted) {
        throw SegmentationError("PELT predict() called before fit()");
    }
    if (!(penalty >= 0.0)) {
        throw std::invalid_argument("PELT penalty must be non-negative");
    }
    const std::size_t n = m_numSamples;
    const std::size_t minSize = m_config.minSize;
    const std::size_t jump = m_config.jump;
    if (n == 0 || minSize > n) {
        throw SegmentationError("Signal of length " + std::to_string(n) +
                                " is shorter than the minimum segment size " +
                                std::to_string(minSize));
    }

    // Candidate ends: multiples of jump that leave room for a first segment,
    // then the signal end.
    std::vector<std::size_t> ends;
    for (std::size_t k = 0; k < n; k += jump) {
        if (k >= minSize) {
            ends.push_back(k);
        }
    }
    ends.push_back(n);

    std::vector<std::optional<Partition>> best(n + 1);
    best[0] = Partition{0.0, 0};

    std::vector<std::size_t> admissible;
    std::vector<double> candidateCosts;

    for (const std::size_t end : ends) {
        admissible.push_back(((end - minSize) / jump) * jump);

        candidateCosts.assign(admissible.size(), std::numeric_limits<double>::infinity());
        std::optional<Partition> winner;
        for (std::size_t a = 0; a < admissible.size(); ++a) {
            const std::size_t start = admissible[a];
            if (!best[start]) {
                continue;
            }
            const double total = best[start]->cost + m_cost->error(start, end) + penalty;
            candidateCosts[a] = total;
            if (!winner || total < winner->cost) {
                winner = Partition{total, start};
            }
        }
        if (!winner) {
            throw SegmentationError("No admissible segmentation ends at index " + std::to_string(end));
        }
        best[end] = winner;

        // Drop starts that can never beat the current optimum again.
        std::vector<std::size_t> kept;
        kept.reserve(admissible.size());
        for (std::size_t a = 0; a < admissible.size(); ++a) {
            if (candidateCosts[a] <= winner->cost + penalty) {
                kept.push_back(admissible[a]);
            }
        }
        admissible = std::move(kept);
    }

    std::vector<std::size_t> breakpoints;
    for (std::size_t end = n; end > 0; end = best[end]->lastStart) {
        breakpoints.push_back(end);
    }
    std::reverse(breakpoints.begin(), breakpoints.end());
    return breakpoints;
}

SolverFactory pelt_solver_factory(std::size_t minSize, std::size_t jump) {
    return [minSize, jump](CostModel model) -> std::unique_ptr<ChangePointSolver> {
        PeltConfig config;
        config.model = model;
        config.minSize = minSize;
        config.jump = jump;
        return std::make_unique<PeltSolver>(config);
    };
}

} // namespace signalflow
