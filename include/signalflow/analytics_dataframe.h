#pragma once

#include "column_view.h"

#include <arrow/array.h>
#include <arrow/result.h>
#include <arrow/table.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace signalflow {

// Immutable, time-indexed table. Every transformation returns a new frame
// that shares buffers with the old one where it can.
class AnalyticsDataFrame {
public:
    AnalyticsDataFrame();
    explicit AnalyticsDataFrame(std::shared_ptr<arrow::Table> table);

    AnalyticsDataFrame(const AnalyticsDataFrame&) = delete;
    AnalyticsDataFrame& operator=(const AnalyticsDataFrame&) = delete;

    AnalyticsDataFrame(AnalyticsDataFrame&&) = default;
    AnalyticsDataFrame& operator=(AnalyticsDataFrame&&) = default;

    arrow::Result<AnalyticsDataFrame> slice_by_row_index(
        int64_t start, int64_t end) const;

    // Rows with start <= timestamp <= end (unix seconds).
    arrow::Result<AnalyticsDataFrame> select_rows_by_timestamp(
        int64_t start, int64_t end) const;

    arrow::Result<AnalyticsDataFrame> select_columns(
        const std::vector<std::string>& column_names) const;

    // Missing names are ignored.
    arrow::Result<AnalyticsDataFrame> drop_columns(
        const std::vector<std::string>& column_names) const;

    arrow::Result<AnalyticsDataFrame> rename_column(
        const std::string& from, const std::string& to) const;

    // Appends the column, or replaces an existing column of the same name.
    arrow::Result<AnalyticsDataFrame> with_column(
        const std::string& name, const std::shared_ptr<arrow::Array>& values) const;

    // Interprets the timestamp column as unix seconds. Accepts int64, any
    // Arrow timestamp unit, date32/date64 and strings in `string_format`
    // (strptime syntax).
    arrow::Result<AnalyticsDataFrame> with_unix_timestamp(
        const std::string& source_column,
        const std::string& output_column_name,
        const std::string& string_format = "%Y-%m-%d %H:%M:%S") const;

    template<typename T>
    arrow::Result<ColumnView<T>> get_column_view(const std::string& column_name) const {
        return ColumnView<T>::from_arrow_column(table_, column_name);
    }

    // Column cast to float64; nulls become NaN.
    arrow::Result<std::vector<double>> numeric_column(const std::string& column_name) const;

    // Column cast to utf8; nulls become std::nullopt.
    arrow::Result<std::vector<std::optional<std::string>>> string_column(
        const std::string& column_name) const;

    // Values of the timestamp column. Nulls are an error.
    arrow::Result<std::vector<int64_t>> timestamps() const;

    void set_timestamp_column(const std::string& column_name);
    const std::optional<std::string>& timestamp_column() const { return timestamp_column_; }

    int64_t num_rows() const;
    int64_t num_columns() const;
    std::vector<std::string> column_names() const;
    bool has_column(const std::string& column_name) const;

    std::shared_ptr<arrow::Table> get_table() const { return table_; }

private:
    std::shared_ptr<arrow::Table> table_;
    std::optional<std::string> timestamp_column_;

    AnalyticsDataFrame create_from_table(std::shared_ptr<arrow::Table> table) const;
};

} // namespace signalflow
