#include "signalflow/pivot_detector.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <optional>
#include <random>
#include <vector>

using signalflow::PivotKind;
using signalflow::detect_pivots;

namespace {

std::vector<std::size_t> marked(const std::vector<std::optional<double>>& pivots) {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < pivots.size(); ++i) {
        if (pivots[i]) {
            indices.push_back(i);
        }
    }
    return indices;
}

} // namespace

TEST(PivotDetectorTest, FindsHighsAndLowsWithUnitWindows) {
    const std::vector<double> osc{1, 5, 2, 8, 3, 1, 9, 2};

    const auto highs = detect_pivots(osc, 1, 1, PivotKind::High);
    const auto lows = detect_pivots(osc, 1, 1, PivotKind::Low);

    EXPECT_EQ(marked(highs), (std::vector<std::size_t>{1, 3, 6}));
    EXPECT_EQ(marked(lows), (std::vector<std::size_t>{2, 5}));
}

TEST(PivotDetectorTest, MarkedEntriesCarryTheOscillatorValue) {
    const std::vector<double> osc{1, 5, 2, 8, 3, 1, 9, 2};
    const auto highs = detect_pivots(osc, 1, 1, PivotKind::High);

    ASSERT_TRUE(highs[3].has_value());
    EXPECT_DOUBLE_EQ(*highs[3], 8.0);
    EXPECT_DOUBLE_EQ(*highs[6], 9.0);
}

TEST(PivotDetectorTest, OutputLengthMatchesInput) {
    const std::vector<double> osc{3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5};
    EXPECT_EQ(detect_pivots(osc, 2, 3, PivotKind::High).size(), osc.size());
    EXPECT_EQ(detect_pivots(osc, 2, 3, PivotKind::Low).size(), osc.size());
}

TEST(PivotDetectorTest, EdgesOutsideTheWindowsAreNeverMarked) {
    // Global max at index 0 and global min at the last index.
    const std::vector<double> osc{10, 4, 6, 3, 7, 2, 5, 0};
    const auto highs = detect_pivots(osc, 2, 2, PivotKind::High);
    const auto lows = detect_pivots(osc, 2, 2, PivotKind::Low);

    for (std::size_t i : {0u, 1u, 6u, 7u}) {
        EXPECT_FALSE(highs[i].has_value()) << "index " << i;
        EXPECT_FALSE(lows[i].has_value()) << "index " << i;
    }
}

TEST(PivotDetectorTest, ShortSeriesIsAllAbsent) {
    const std::vector<double> osc{1, 3, 2, 4};
    const auto highs = detect_pivots(osc, 2, 2, PivotKind::High);
    ASSERT_EQ(highs.size(), 4u);
    EXPECT_TRUE(marked(highs).empty());

    EXPECT_TRUE(detect_pivots(std::vector<double>{}, 1, 1, PivotKind::Low).empty());
}

TEST(PivotDetectorTest, BackWindowTiesStayEligible) {
    const std::vector<double> osc{1, 3, 3, 1};
    const auto highs = detect_pivots(osc, 1, 1, PivotKind::High);

    // Index 1 ties its forward neighbour, index 2 ties its backward one.
    EXPECT_EQ(marked(highs), (std::vector<std::size_t>{2}));
}

TEST(PivotDetectorTest, ForwardTiesDisqualifyLows) {
    const std::vector<double> osc{5, 2, 2, 5};
    const auto lows = detect_pivots(osc, 1, 1, PivotKind::Low);
    EXPECT_EQ(marked(lows), (std::vector<std::size_t>{2}));
}

TEST(PivotDetectorTest, TimeSeriesOverloadUsesValues) {
    const auto series = signalflow::TimeSeries::from_values({1, 5, 2, 8, 3, 1, 9, 2});
    EXPECT_EQ(marked(detect_pivots(series, 1, 1, PivotKind::High)),
              (std::vector<std::size_t>{1, 3, 6}));
}

TEST(PivotDetectorTest, HugeWindowsAreAllAbsent) {
    const std::vector<double> osc{1, 2, 3, 4, 5};
    constexpr std::size_t huge = std::numeric_limits<std::size_t>::max();

    for (const auto kind : {PivotKind::High, PivotKind::Low}) {
        EXPECT_TRUE(marked(detect_pivots(osc, huge, 1, kind)).empty());
        EXPECT_TRUE(marked(detect_pivots(osc, 1, huge, kind)).empty());
        EXPECT_TRUE(marked(detect_pivots(osc, huge, huge, kind)).empty());
        EXPECT_TRUE(marked(detect_pivots(osc, huge - 1, 2, kind)).empty());
        EXPECT_EQ(detect_pivots(osc, huge, huge, kind).size(), osc.size());
    }
}

TEST(PivotDetectorTest, RandomSeriesSatisfyWindowRules) {
    std::mt19937 rng(20250204);
    // Few distinct levels so plateaus and ties are common.
    std::uniform_int_distribution<int> level(0, 5);
    std::uniform_int_distribution<std::size_t> length(0, 40);
    std::uniform_int_distribution<std::size_t> window(0, 6);

    for (int trial = 0; trial < 500; ++trial) {
        std::vector<double> series(length(rng));
        for (auto& value : series) {
            value = static_cast<double>(level(rng));
        }
        const std::size_t left = window(rng);
        const std::size_t right = window(rng);

        const auto highs = detect_pivots(series, left, right, PivotKind::High);
        const auto lows = detect_pivots(series, left, right, PivotKind::Low);
        ASSERT_EQ(highs.size(), series.size());
        ASSERT_EQ(lows.size(), series.size());
        EXPECT_EQ(highs, detect_pivots(series, left, right, PivotKind::High));
        EXPECT_EQ(lows, detect_pivots(series, left, right, PivotKind::Low));

        for (std::size_t i = 0; i < series.size(); ++i) {
            const bool inRange = i >= left && i + right < series.size();
            if (!inRange) {
                EXPECT_FALSE(highs[i].has_value()) << "trial " << trial << " index " << i;
                EXPECT_FALSE(lows[i].has_value()) << "trial " << trial << " index " << i;
                continue;
            }
            const auto back = series.begin() + static_cast<std::ptrdiff_t>(i - left);
            const auto at = series.begin() + static_cast<std::ptrdiff_t>(i);
            const auto forwardEnd = at + 1 + static_cast<std::ptrdiff_t>(right);

            const bool isHigh = std::all_of(back, at, [&](double v) { return series[i] >= v; }) &&
                                std::all_of(at + 1, forwardEnd, [&](double v) { return series[i] > v; });
            const bool isLow = std::all_of(back, at, [&](double v) { return series[i] <= v; }) &&
                               std::all_of(at + 1, forwardEnd, [&](double v) { return series[i] < v; });

            EXPECT_EQ(highs[i].has_value(), isHigh) << "trial " << trial << " index " << i;
            EXPECT_EQ(lows[i].has_value(), isLow) << "trial " << trial << " index " << i;
            if (highs[i]) {
                EXPECT_EQ(*highs[i], series[i]);
            }
        }
    }
}
