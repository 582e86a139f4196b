#pragma once

#include "signalflow/signalflow.h"

#include <arrow/builder.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace signalflow::test_support {

inline void EnsureArrowInitialized() {
    static const arrow::Status status = signalflow::initialize();
    ASSERT_TRUE(status.ok()) << status.ToString();
}

inline std::shared_ptr<arrow::Array> Int64Array(const std::vector<int64_t>& values) {
    arrow::Int64Builder builder;
    EXPECT_TRUE(builder.AppendValues(values).ok());
    std::shared_ptr<arrow::Array> array;
    EXPECT_TRUE(builder.Finish(&array).ok());
    return array;
}

inline std::shared_ptr<arrow::Array> DoubleArray(const std::vector<double>& values) {
    arrow::DoubleBuilder builder;
    EXPECT_TRUE(builder.AppendValues(values).ok());
    std::shared_ptr<arrow::Array> array;
    EXPECT_TRUE(builder.Finish(&array).ok());
    return array;
}

inline std::shared_ptr<arrow::Array> StringArray(const std::vector<std::optional<std::string>>& values) {
    arrow::StringBuilder builder;
    for (const auto& value : values) {
        EXPECT_TRUE((value ? builder.Append(*value) : builder.AppendNull()).ok());
    }
    std::shared_ptr<arrow::Array> array;
    EXPECT_TRUE(builder.Finish(&array).ok());
    return array;
}

// Bars table with an int64 Datetime column and a Close column.
inline AnalyticsDataFrame MakeBars(const std::vector<int64_t>& timestamps,
                                   const std::vector<double>& close) {
    auto schema = arrow::schema({
        arrow::field("Datetime", arrow::int64()),
        arrow::field("Close", arrow::float64()),
    });
    AnalyticsDataFrame df(arrow::Table::Make(schema, {Int64Array(timestamps), DoubleArray(close)}));
    df.set_timestamp_column("Datetime");
    return df;
}

// Two flat regimes joined by a jump, with a small zig-zag so pivots form.
inline std::vector<double> StepSeries(std::size_t half, double low, double high) {
    std::vector<double> values;
    for (std::size_t i = 0; i < 2 * half; ++i) {
        const double base = i < half ? low : high;
        values.push_back(base + ((i % 4 == 1) ? 0.5 : (i % 4 == 3 ? -0.5 : 0.0)));
    }
    return values;
}

} // namespace signalflow::test_support
