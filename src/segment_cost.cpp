#include "signalflow/segment_cost.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace signalflow {

namespace {

void check_segment(std::size_t start, std::size_t end, std::size_t n,
                   std::size_t min_size, bool fitted) {
    if (!fitted) {
        throw SegmentationError("Segment cost used before fit()");
    }
    if (end > n || start >= end) {
        throw SegmentationError("Segment [" + std::to_string(start) + ", " +
                                std::to_string(end) + ") outside signal of length " +
                                std::to_string(n));
    }
    if (end - start < min_size) {
        throw SegmentationError("Segment [" + std::to_string(start) + ", " +
                                std::to_string(end) + ") shorter than minimum size " +
                                std::to_string(min_size));
    }
}

// Prefix sums give O(1) segment cost: sum((x - mean)^2) = sum(x^2) - sum(x)^2 / n.
class L2Cost final : public SegmentCost {
public:
    void fit(const Eigen::VectorXd& signal) override {
        const auto n = static_cast<std::size_t>(signal.size());
        prefixSum_.assign(n + 1, 0.0);
        prefixSq_.assign(n + 1, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            prefixSum_[i + 1] = prefixSum_[i] + signal[static_cast<Eigen::Index>(i)];
            prefixSq_[i + 1] = prefixSq_[i] + signal[static_cast<Eigen::Index>(i)] * signal[static_cast<Eigen::Index>(i)];
        }
        n_ = n;
        fitted_ = true;
    }

    double error(std::size_t start, std::size_t end) const override {
        check_segment(start, end, n_, min_size(), fitted_);
        const double count = static_cast<double>(end - start);
        const double sum = prefixSum_[end] - prefixSum_[start];
        const double sq = prefixSq_[end] - prefixSq_[start];
        return std::max(0.0, sq - (sum * sum) / count);
    }

    std::size_t min_size() const override { return 1; }
    CostModel model() const override { return CostModel::L2; }

private:
    std::vector<double> prefixSum_;
    std::vector<double> prefixSq_;
    std::size_t n_ = 0;
    bool fitted_ = false;
};

class L1Cost final : public SegmentCost {
public:
    void fit(const Eigen::VectorXd& signal) override {
        signal_ = signal;
        fitted_ = true;
    }

    double error(std::size_t start, std::size_t end) const override {
        check_segment(start, end, static_cast<std::size_t>(signal_.size()), min_size(), fitted_);
        std::vector<double> segment(signal_.data() + start, signal_.data() + end);
        const std::size_t count = segment.size();
        const std::size_t mid = count / 2;
        std::nth_element(segment.begin(), segment.begin() + static_cast<std::ptrdiff_t>(mid), segment.end());
        double median = segment[mid];
        if (count % 2 == 0) {
            const double lower = *std::max_element(segment.begin(), segment.begin() + static_cast<std::ptrdiff_t>(mid));
            median = 0.5 * (median + lower);
        }

        double total = 0.0;
        for (const double value : segment) {
            total += std::fabs(value - median);
        }
        return total;
    }

    std::size_t min_size() const override { return 2; }
    CostModel model() const override { return CostModel::L1; }

private:
    Eigen::VectorXd signal_;
    bool fitted_ = false;
};

// count * log(variance + small diagonal), the Gaussian likelihood cost for a
// change in mean and/or variance.
class NormalCost final : public SegmentCost {
public:
    void fit(const Eigen::VectorXd& signal) override {
        const auto n = static_cast<std::size_t>(signal.size());
        prefixSum_.assign(n + 1, 0.0);
        prefixSq_.assign(n + 1, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            const double x = signal[static_cast<Eigen::Index>(i)];
            prefixSum_[i + 1] = prefixSum_[i] + x;
            prefixSq_[i + 1] = prefixSq_[i] + x * x;
        }
        n_ = n;
        fitted_ = true;
    }

    double error(std::size_t start, std::size_t end) const override {
        check_segment(start, end, n_, min_size(), fitted_);
        const double count = static_cast<double>(end - start);
        const double sum = prefixSum_[end] - prefixSum_[start];
        const double sq = prefixSq_[end] - prefixSq_[start];
        const double variance = std::max(0.0, sq / count - (sum / count) * (sum / count));
        return count * std::log(variance + kSmallDiagonal);
    }

    std::size_t min_size() const override { return 2; }
    CostModel model() const override { return CostModel::Normal; }

private:
    static constexpr double kSmallDiagonal = 1e-6;

    std::vector<double> prefixSum_;
    std::vector<double> prefixSq_;
    std::size_t n_ = 0;
    bool fitted_ = false;
};

// Kernel cost: trace(K_seg) - sum(K_seg) / count with K = exp(-gamma * |xi - xj|^2).
// gamma is 1 / median of the pairwise squared distances; the scaled distances
// are clipped to [0.01, 100]. A 2-D prefix sum over K makes each query O(1).
class RbfCost final : public SegmentCost {
public:
    void fit(const Eigen::VectorXd& signal) override {
        const Eigen::Index n = signal.size();

        std::vector<double> distances;
        distances.reserve(static_cast<std::size_t>(n) * static_cast<std::size_t>(std::max<Eigen::Index>(n - 1, 0)) / 2);
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = i + 1; j < n; ++j) {
                const double d = signal[i] - signal[j];
                distances.push_back(d * d);
            }
        }

        gamma_ = 1.0;
        if (!distances.empty()) {
            const double median = median_of(distances);
            if (median != 0.0) {
                gamma_ = 1.0 / median;
            }
        }

        // prefix_(i, j) = sum of K over rows [0, i) and columns [0, j).
        prefix_ = Eigen::MatrixXd::Zero(n + 1, n + 1);
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < n; ++j) {
                double k = 1.0;
                if (i != j) {
                    const double d = signal[i] - signal[j];
                    const double scaled = std::clamp(d * d * gamma_, 1e-2, 1e2);
                    k = std::exp(-scaled);
                }
                prefix_(i + 1, j + 1) = k + prefix_(i, j + 1) + prefix_(i + 1, j) - prefix_(i, j);
            }
        }
        n_ = static_cast<std::size_t>(n);
        fitted_ = true;
    }

    double error(std::size_t start, std::size_t end) const override {
        check_segment(start, end, n_, min_size(), fitted_);
        const auto s = static_cast<Eigen::Index>(start);
        const auto e = static_cast<Eigen::Index>(end);
        const double blockSum = prefix_(e, e) - prefix_(s, e) - prefix_(e, s) + prefix_(s, s);
        const double count = static_cast<double>(end - start);
        // The kernel diagonal is exp(0) = 1.
        return count - blockSum / count;
    }

    std::size_t min_size() const override { return 1; }
    CostModel model() const override { return CostModel::Rbf; }

private:
    static double median_of(std::vector<double>& values) {
        const std::size_t mid = values.size() / 2;
        std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
        double median = values[mid];
        if (values.size() % 2 == 0) {
            const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
            median = 0.5 * (median + lower);
        }
        return median;
    }

    Eigen::MatrixXd prefix_;
    double gamma_ = 1.0;
    std::size_t n_ = 0;
    bool fitted_ = false;
};

} // namespace

CostModel parse_cost_model(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "l1") return CostModel::L1;
    if (lowered == "l2") return CostModel::L2;
    if (lowered == "normal") return CostModel::Normal;
    if (lowered == "rbf") return CostModel::Rbf;
    throw std::invalid_argument("Unknown change-point cost model: " + name);
}

std::string to_string(CostModel model) {
    switch (model) {
        case CostModel::L1:     return "l1";
        case CostModel::L2:     return "l2";
        case CostModel::Normal: return "normal";
        case CostModel::Rbf:    return "rbf";
    }
    return "unknown";
}

std::unique_ptr<SegmentCost> make_segment_cost(CostModel model) {
    switch (model) {
        case CostModel::L1:     return std::make_unique<L1Cost>();
        case CostModel::L2:     return std::make_unique<L2Cost>();
        case CostModel::Normal: return std::make_unique<NormalCost>();
        case CostModel::Rbf:    return std::make_unique<RbfCost>();
    }
    throw std::invalid_argument("Unsupported change-point cost model");
}

} // namespace signalflow
