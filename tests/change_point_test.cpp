#include "signalflow/change_point.h"
#include "signalflow/simple_logger.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace signalflow;

namespace {

std::vector<double> levels(std::initializer_list<std::pair<double, std::size_t>> runs) {
    std::vector<double> values;
    for (const auto& [level, count] : runs) {
        values.insert(values.end(), count, level);
    }
    return values;
}

// Returns a fixed breakpoint list regardless of the signal.
class FixedSolver : public ChangePointSolver {
public:
    explicit FixedSolver(std::vector<std::size_t> breakpoints)
        : m_breakpoints(std::move(breakpoints)) {}

    void fit(std::span<const double>) override {}
    std::vector<std::size_t> predict(double) const override { return m_breakpoints; }

private:
    std::vector<std::size_t> m_breakpoints;
};

class FailingSolver : public ChangePointSolver {
public:
    void fit(std::span<const double>) override {}
    std::vector<std::size_t> predict(double) const override {
        throw SegmentationError("cannot segment");
    }
};

SolverFactory fixed_factory(std::vector<std::size_t> breakpoints) {
    return [breakpoints](CostModel) -> std::unique_ptr<ChangePointSolver> {
        return std::make_unique<FixedSolver>(breakpoints);
    };
}

class ChangePointDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimpleLogger::SetCallback([this](LogLevel level, const std::string& message) {
            if (level == LogLevel::Warning) {
                warnings.push_back(message);
            }
        });
    }

    void TearDown() override {
        SimpleLogger::ClearCallback();
    }

    std::vector<std::string> warnings;
};

} // namespace

TEST(SegmentCostTest, ParsesModelNamesCaseInsensitively) {
    EXPECT_EQ(parse_cost_model("rbf"), CostModel::Rbf);
    EXPECT_EQ(parse_cost_model("L2"), CostModel::L2);
    EXPECT_EQ(parse_cost_model("Normal"), CostModel::Normal);
    EXPECT_EQ(parse_cost_model("l1"), CostModel::L1);
    EXPECT_THROW(parse_cost_model("ar"), std::invalid_argument);
    EXPECT_EQ(to_string(CostModel::Rbf), "rbf");
}

TEST(SegmentCostTest, L2CostIsTheSumOfSquaredDeviations) {
    auto cost = make_segment_cost(CostModel::L2);
    Eigen::VectorXd signal(4);
    signal << 1.0, 2.0, 3.0, 10.0;
    cost->fit(signal);

    EXPECT_NEAR(cost->error(0, 3), 2.0, 1e-12);
    EXPECT_NEAR(cost->error(3, 4), 0.0, 1e-12);
}

TEST(SegmentCostTest, L1CostUsesTheMedian) {
    auto cost = make_segment_cost(CostModel::L1);
    Eigen::VectorXd signal(3);
    signal << 1.0, 2.0, 9.0;
    cost->fit(signal);

    EXPECT_NEAR(cost->error(0, 3), 8.0, 1e-12);
}

TEST(SegmentCostTest, RejectsSegmentsShorterThanMinimum) {
    auto cost = make_segment_cost(CostModel::Normal);
    Eigen::VectorXd signal(4);
    signal << 1.0, 2.0, 3.0, 4.0;
    cost->fit(signal);

    EXPECT_EQ(cost->min_size(), 2u);
    EXPECT_THROW(cost->error(1, 2), SegmentationError);
    EXPECT_THROW(cost->error(0, 5), SegmentationError);
}

TEST(SegmentCostTest, RbfCostIsSmallInsideAFlatSegment) {
    auto cost = make_segment_cost(CostModel::Rbf);
    const auto values = levels({{0.0, 10}, {10.0, 10}});
    cost->fit(Eigen::Map<const Eigen::VectorXd>(values.data(), 20));

    EXPECT_LT(cost->error(0, 10), 0.2);
    EXPECT_GT(cost->error(0, 20), 5.0);
}

TEST(PeltSolverTest, FindsSingleStep) {
    PeltConfig config;
    config.model = CostModel::L2;
    PeltSolver solver(config);
    const auto signal = levels({{0.0, 10}, {10.0, 10}});
    solver.fit(signal);

    EXPECT_EQ(solver.predict(1.0), (std::vector<std::size_t>{10, 20}));
}

TEST(PeltSolverTest, FindsTwoStepsOnTheJumpGrid) {
    PeltSolver solver(PeltConfig{CostModel::L2, 2, 5});
    const auto signal = levels({{0.0, 10}, {10.0, 10}, {0.0, 10}});
    solver.fit(signal);

    EXPECT_EQ(solver.predict(1.0), (std::vector<std::size_t>{10, 20, 30}));
}

TEST(PeltSolverTest, RbfModelFindsStep) {
    PeltSolver solver(PeltConfig{CostModel::Rbf, 2, 5});
    const auto signal = levels({{100.0, 15}, {104.0, 15}});
    solver.fit(signal);

    EXPECT_EQ(solver.predict(1.0), (std::vector<std::size_t>{15, 30}));
}

TEST(PeltSolverTest, LargePenaltyKeepsOneSegment) {
    PeltSolver solver(PeltConfig{CostModel::L2, 2, 5});
    const auto signal = levels({{0.0, 10}, {10.0, 10}});
    solver.fit(signal);

    EXPECT_EQ(solver.predict(1e6), (std::vector<std::size_t>{20}));
}

TEST(PeltSolverTest, LastBreakpointIsTheSignalLength) {
    PeltSolver solver(PeltConfig{CostModel::L2, 2, 5});
    const auto signal = levels({{1.0, 7}, {3.0, 6}});
    solver.fit(signal);

    const auto breakpoints = solver.predict(0.5);
    ASSERT_FALSE(breakpoints.empty());
    EXPECT_EQ(breakpoints.back(), 13u);
    EXPECT_TRUE(std::is_sorted(breakpoints.begin(), breakpoints.end()));
}

TEST(PeltSolverTest, ReportsUnsegmentableInput) {
    PeltSolver solver(PeltConfig{CostModel::L2, 2, 5});
    EXPECT_THROW(solver.predict(1.0), SegmentationError);

    const std::vector<double> single{1.0};
    solver.fit(single);
    EXPECT_THROW(solver.predict(1.0), SegmentationError);
}

TEST(PeltSolverTest, RejectsBadParameters) {
    EXPECT_THROW(PeltSolver(PeltConfig{CostModel::L2, 0, 5}), std::invalid_argument);
    EXPECT_THROW(PeltSolver(PeltConfig{CostModel::L2, 2, 0}), std::invalid_argument);

    PeltSolver solver(PeltConfig{});
    const auto signal = levels({{0.0, 10}});
    solver.fit(signal);
    EXPECT_THROW(solver.predict(-1.0), std::invalid_argument);
}

TEST(BinarySegmentationSolverTest, FindsTwoSteps) {
    BinarySegmentationSolver solver(BinarySegmentationConfig{CostModel::L2, 2, 5});
    const auto signal = levels({{0.0, 10}, {10.0, 10}, {0.0, 10}});
    solver.fit(signal);

    EXPECT_EQ(solver.predict(1.0), (std::vector<std::size_t>{10, 20, 30}));
}

TEST(BinarySegmentationSolverTest, FlatSignalHasNoBreaks) {
    BinarySegmentationSolver solver(BinarySegmentationConfig{CostModel::L2, 2, 5});
    const auto signal = levels({{4.0, 25}});
    solver.fit(signal);

    EXPECT_EQ(solver.predict(0.1), (std::vector<std::size_t>{25}));
}

TEST_F(ChangePointDetectorTest, DefaultDetectorDropsTheLengthSentinel) {
    ChangePointDetector detector;
    const auto signal = levels({{0.0, 10}, {10.0, 10}});

    EXPECT_EQ(detector.detect_change_points(signal, 1.0, CostModel::L2),
              (std::vector<std::size_t>{10}));
}

TEST_F(ChangePointDetectorTest, FiltersOutOfRangeIndices) {
    ChangePointDetector detector(fixed_factory({3, 7, 10, 12}));
    const std::vector<double> signal(10, 1.0);

    EXPECT_EQ(detector.detect_change_points(signal, 1.0, CostModel::Rbf),
              (std::vector<std::size_t>{3, 7}));
}

TEST_F(ChangePointDetectorTest, SortsAndDeduplicatesSolverOutput) {
    ChangePointDetector detector(fixed_factory({7, 3, 3, 10}));
    const std::vector<double> signal(10, 1.0);

    EXPECT_EQ(detector.detect_change_points(signal, 1.0, CostModel::Rbf),
              (std::vector<std::size_t>{3, 7}));
}

TEST_F(ChangePointDetectorTest, SolverFailureYieldsEmptySetAndWarning) {
    ChangePointDetector detector([](CostModel) -> std::unique_ptr<ChangePointSolver> {
        return std::make_unique<FailingSolver>();
    });
    const std::vector<double> signal(10, 1.0);

    EXPECT_TRUE(detector.detect_change_points(signal, 1.0, CostModel::Rbf).empty());
    EXPECT_EQ(warnings.size(), 1u);
}

TEST_F(ChangePointDetectorTest, DegenerateInputYieldsEmptySet) {
    ChangePointDetector detector;

    EXPECT_TRUE(detector.detect_change_points({}, 1.0, CostModel::Rbf).empty());

    const std::vector<double> single{5.0};
    EXPECT_TRUE(detector.detect_change_points(single, 1.0, CostModel::Rbf).empty());

    std::vector<double> withNaN(20, 1.0);
    withNaN[4] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(detector.detect_change_points(withNaN, 1.0, CostModel::Rbf).empty());
    EXPECT_EQ(warnings.size(), 2u);
}

TEST_F(ChangePointDetectorTest, AcceptsBinarySegmentationFactory) {
    ChangePointDetector detector(binary_segmentation_factory());
    const auto signal = levels({{0.0, 10}, {10.0, 10}});

    EXPECT_EQ(detector.detect_change_points(signal, 1.0, CostModel::L2),
              (std::vector<std::size_t>{10}));
}
