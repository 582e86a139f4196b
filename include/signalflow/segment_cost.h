#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace signalflow {

// Raised when a signal cannot be segmented with the requested parameters.
class SegmentationError : public std::runtime_error {
public:
    explicit SegmentationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Cost functions a segmentation search can minimise.
enum class CostModel {
    L1,      // absolute deviation from the segment median
    L2,      // squared deviation from the segment mean
    Normal,  // Gaussian negative log-likelihood (mean and variance shift)
    Rbf      // kernel cost with an RBF kernel, median-heuristic bandwidth
};

// Accepts "l1", "l2", "normal", "rbf" (case-insensitive).
CostModel parse_cost_model(const std::string& name);
std::string to_string(CostModel model);

class SegmentCost {
public:
    virtual ~SegmentCost() = default;

    virtual void fit(const Eigen::VectorXd& signal) = 0;

    // Cost of signal[start, end). Throws SegmentationError when the segment
    // is shorter than min_size() or the cost was not fitted.
    virtual double error(std::size_t start, std::size_t end) const = 0;

    virtual std::size_t min_size() const = 0;
    virtual CostModel model() const = 0;
};

std::unique_ptr<SegmentCost> make_segment_cost(CostModel model);

} // namespace signalflow
