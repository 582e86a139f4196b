#pragma once

#include "segment_cost.h"

#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace signalflow {

// fit/predict contract shared by segmentation searches.
class ChangePointSolver {
public:
    virtual ~ChangePointSolver() = default;

    virtual void fit(std::span<const double> signal) = 0;

    // Sorted segment end indices; the last entry is the signal length.
    // Throws SegmentationError when the fitted signal cannot be segmented.
    virtual std::vector<std::size_t> predict(double penalty) const = 0;
};

struct PeltConfig {
    CostModel model = CostModel::L2;
    std::size_t minSize = 2;  // shortest allowed segment
    std::size_t jump = 5;     // breakpoints are searched on this grid
};

// Penalised optimal partitioning with pruning (PELT). Minimises
// sum(segment cost) + penalty * number of segments over breakpoints placed on
// multiples of `jump`.
class PeltSolver : public ChangePointSolver {
public:
    explicit PeltSolver(PeltConfig config);

    void fit(std::span<const double> signal) override;
    std::vector<std::size_t> predict(double penalty) const override;

private:
    PeltConfig m_config;
    std::unique_ptr<SegmentCost> m_cost;
    std::size_t m_numSamples = 0;
    bool m_fitted = false;
};

struct BinarySegmentationConfig {
    CostModel model = CostModel::L2;
    std::size_t minSegmentLength = 2;
    std::size_t jump = 5;
};

// Greedy top-down search: split the segment with the largest cost reduction
// until no split gains more than the penalty.
class BinarySegmentationSolver : public ChangePointSolver {
public:
    explicit BinarySegmentationSolver(BinarySegmentationConfig config);

    void fit(std::span<const double> signal) override;
    std::vector<std::size_t> predict(double penalty) const override;

private:
    struct Split {
        std::size_t index = 0;
        double gain = 0.0;
        bool valid = false;
    };

    Split bestSplit(std::size_t start, std::size_t end) const;

    BinarySegmentationConfig m_config;
    std::unique_ptr<SegmentCost> m_cost;
    std::size_t m_numSamples = 0;
    bool m_fitted = false;
};

using SolverFactory = std::function<std::unique_ptr<ChangePointSolver>(CostModel)>;

SolverFactory pelt_solver_factory(std::size_t minSize = 2, std::size_t jump = 5);
SolverFactory binary_segmentation_factory(std::size_t minSegmentLength = 2, std::size_t jump = 5);

// Adapter between a solver and callers that index arrays with its output.
// Every returned index lies in [0, series.size()). Solver failures and
// degenerate input give an empty set instead of an exception.
class ChangePointDetector {
public:
    ChangePointDetector();
    explicit ChangePointDetector(SolverFactory factory);

    std::vector<std::size_t> detect_change_points(std::span<const double> series,
                                                  double penalty,
                                                  CostModel model) const;

private:
    SolverFactory m_factory;
};

} // namespace signalflow
