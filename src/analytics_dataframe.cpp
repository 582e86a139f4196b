#include "signalflow/analytics_dataframe.h"

#include <arrow/builder.h>
#include <arrow/compute/api.h>
#include <arrow/compute/cast.h>
#include <arrow/datum.h>
#include <arrow/scalar.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace signalflow {

namespace {

int64_t floor_div(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

int64_t units_per_second(arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND: return 1;
        case arrow::TimeUnit::MILLI:  return 1000;
        case arrow::TimeUnit::MICRO:  return 1000000;
        case arrow::TimeUnit::NANO:   return 1000000000;
    }
    return 1;
}

arrow::Result<std::shared_ptr<arrow::ChunkedArray>> cast_column(
    const std::shared_ptr<arrow::ChunkedArray>& column,
    const std::shared_ptr<arrow::DataType>& type) {

    arrow::compute::CastOptions cast_opts;
    cast_opts.to_type = type;
    ARROW_ASSIGN_OR_RAISE(auto datum, arrow::compute::Cast(arrow::Datum(column), cast_opts));
    return datum.chunked_array();
}

// Appends int64 chunks to `builder`, scaling each value by `scale` (> 0
// multiplies, < 0 floor-divides by -scale).
arrow::Status append_scaled(const std::shared_ptr<arrow::ChunkedArray>& column,
                            int64_t scale, arrow::Int64Builder& builder) {
    for (const auto& chunk : column->chunks()) {
        auto values = std::static_pointer_cast<arrow::Int64Array>(chunk);
        for (int64_t i = 0; i < values->length(); ++i) {
            if (values->IsNull(i)) {
                ARROW_RETURN_NOT_OK(builder.AppendNull());
                continue;
            }
            const int64_t raw = values->Value(i);
            const int64_t seconds = scale > 0 ? raw * scale : floor_div(raw, -scale);
            ARROW_RETURN_NOT_OK(builder.Append(seconds));
        }
    }
    return arrow::Status::OK();
}

} // namespace

AnalyticsDataFrame::AnalyticsDataFrame() = default;

AnalyticsDataFrame::AnalyticsDataFrame(std::shared_ptr<arrow::Table> table)
    : table_(std::move(table)) {}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::slice_by_row_index(
    int64_t start, int64_t end) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }

    if (start < 0 || end > table_->num_rows() || start > end) {
        return arrow::Status::Invalid("Invalid row indices");
    }

    return create_from_table(table_->Slice(start, end - start));
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::select_rows_by_timestamp(
    int64_t start, int64_t end) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }
    if (!timestamp_column_) {
        return arrow::Status::Invalid("Timestamp column not set");
    }

    auto ts_column = table_->GetColumnByName(*timestamp_column_);
    if (!ts_column) {
        return arrow::Status::Invalid("Timestamp column not found: ", *timestamp_column_);
    }
    ARROW_ASSIGN_OR_RAISE(auto ts_int64, cast_column(ts_column, arrow::int64()));

    auto start_scalar = arrow::MakeScalar(start);
    auto end_scalar = arrow::MakeScalar(end);

    ARROW_ASSIGN_OR_RAISE(auto ge_start, arrow::compute::CallFunction("greater_equal", { arrow::Datum(ts_int64), start_scalar }));
    ARROW_ASSIGN_OR_RAISE(auto le_end, arrow::compute::CallFunction("less_equal", { arrow::Datum(ts_int64), end_scalar }));
    ARROW_ASSIGN_OR_RAISE(auto mask, arrow::compute::CallFunction("and", { ge_start, le_end }));
    ARROW_ASSIGN_OR_RAISE(auto filtered, arrow::compute::Filter(table_, mask));

    return create_from_table(filtered.table());
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::select_columns(
    const std::vector<std::string>& column_names) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }

    std::vector<int> column_indices;
    auto schema = table_->schema();

    for (const auto& name : column_names) {
        auto index = schema->GetFieldIndex(name);
        if (index == -1) {
            return arrow::Status::Invalid("Column not found: ", name);
        }
        column_indices.push_back(index);
    }

    ARROW_ASSIGN_OR_RAISE(auto selected_table, table_->SelectColumns(column_indices));
    return create_from_table(selected_table);
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::drop_columns(
    const std::vector<std::string>& column_names) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }

    auto table = table_;
    for (const auto& name : column_names) {
        const int index = table->schema()->GetFieldIndex(name);
        if (index == -1) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(table, table->RemoveColumn(index));
    }

    AnalyticsDataFrame result = create_from_table(table);
    if (timestamp_column_ && !result.has_column(*timestamp_column_)) {
        result.timestamp_column_.reset();
    }
    return result;
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::rename_column(
    const std::string& from, const std::string& to) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }
    if (from != to && has_column(to)) {
        return arrow::Status::Invalid("Column already exists: ", to);
    }

    auto names = table_->ColumnNames();
    auto it = std::find(names.begin(), names.end(), from);
    if (it == names.end()) {
        return arrow::Status::Invalid("Column not found: ", from);
    }
    *it = to;

    ARROW_ASSIGN_OR_RAISE(auto renamed, table_->RenameColumns(names));
    AnalyticsDataFrame result = create_from_table(renamed);
    if (timestamp_column_ && *timestamp_column_ == from) {
        result.timestamp_column_ = to;
    }
    return result;
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::with_column(
    const std::string& name, const std::shared_ptr<arrow::Array>& values) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }
    if (!values) {
        return arrow::Status::Invalid("Column values are null: ", name);
    }
    if (values->length() != table_->num_rows()) {
        return arrow::Status::Invalid("Column '", name, "' has ", values->length(),
                                      " rows, table has ", table_->num_rows());
    }

    auto field = arrow::field(name, values->type());
    auto column = std::make_shared<arrow::ChunkedArray>(values);
    const int index = table_->schema()->GetFieldIndex(name);

    std::shared_ptr<arrow::Table> updated;
    if (index == -1) {
        ARROW_ASSIGN_OR_RAISE(updated, table_->AddColumn(table_->num_columns(), field, column));
    } else {
        ARROW_ASSIGN_OR_RAISE(updated, table_->SetColumn(index, field, column));
    }
    return create_from_table(updated);
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::with_unix_timestamp(
    const std::string& source_column,
    const std::string& output_column_name,
    const std::string& string_format) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }

    auto column = table_->GetColumnByName(source_column);
    if (!column) {
        return arrow::Status::Invalid("Timestamp column not found: ", source_column);
    }

    arrow::Int64Builder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(table_->num_rows()));

    const auto type_id = column->type()->id();
    switch (type_id) {
        case arrow::Type::INT64:
        case arrow::Type::INT32:
        case arrow::Type::UINT32: {
            ARROW_ASSIGN_OR_RAISE(auto seconds, cast_column(column, arrow::int64()));
            ARROW_RETURN_NOT_OK(append_scaled(seconds, 1, builder));
            break;
        }
        case arrow::Type::TIMESTAMP: {
            auto unit = std::static_pointer_cast<arrow::TimestampType>(column->type())->unit();
            ARROW_ASSIGN_OR_RAISE(auto raw, cast_column(column, arrow::int64()));
            ARROW_RETURN_NOT_OK(append_scaled(raw, -units_per_second(unit), builder));
            break;
        }
        case arrow::Type::DATE32: {
            for (const auto& chunk : column->chunks()) {
                auto days = std::static_pointer_cast<arrow::Date32Array>(chunk);
                for (int64_t i = 0; i < days->length(); ++i) {
                    if (days->IsNull(i)) {
                        ARROW_RETURN_NOT_OK(builder.AppendNull());
                    } else {
                        ARROW_RETURN_NOT_OK(builder.Append(static_cast<int64_t>(days->Value(i)) * 86400));
                    }
                }
            }
            break;
        }
        case arrow::Type::DATE64: {
            for (const auto& chunk : column->chunks()) {
                auto millis = std::static_pointer_cast<arrow::Date64Array>(chunk);
                for (int64_t i = 0; i < millis->length(); ++i) {
                    if (millis->IsNull(i)) {
                        ARROW_RETURN_NOT_OK(builder.AppendNull());
                    } else {
                        ARROW_RETURN_NOT_OK(builder.Append(floor_div(millis->Value(i), 1000)));
                    }
                }
            }
            break;
        }
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING: {
            arrow::compute::StrptimeOptions options(string_format, arrow::TimeUnit::SECOND);
            ARROW_ASSIGN_OR_RAISE(auto parsed, arrow::compute::CallFunction("strptime", { arrow::Datum(column) }, &options));
            ARROW_ASSIGN_OR_RAISE(auto seconds, cast_column(parsed.chunked_array(), arrow::int64()));
            ARROW_RETURN_NOT_OK(append_scaled(seconds, 1, builder));
            break;
        }
        default:
            return arrow::Status::TypeError("Unsupported timestamp column type for '", source_column,
                                            "': ", column->type()->ToString());
    }

    std::shared_ptr<arrow::Array> unix_ts_array;
    ARROW_RETURN_NOT_OK(builder.Finish(&unix_ts_array));

    ARROW_ASSIGN_OR_RAISE(auto result, with_column(output_column_name, unix_ts_array));
    result.timestamp_column_ = output_column_name;
    return result;
}

arrow::Result<std::vector<double>> AnalyticsDataFrame::numeric_column(
    const std::string& column_name) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }
    auto column = table_->GetColumnByName(column_name);
    if (!column) {
        return arrow::Status::Invalid("Column not found: ", column_name);
    }
    ARROW_ASSIGN_OR_RAISE(auto doubles, cast_column(column, arrow::float64()));

    std::vector<double> values;
    values.reserve(static_cast<std::size_t>(doubles->length()));
    for (const auto& chunk : doubles->chunks()) {
        auto typed = std::static_pointer_cast<arrow::DoubleArray>(chunk);
        for (int64_t i = 0; i < typed->length(); ++i) {
            values.push_back(typed->IsNull(i) ? std::numeric_limits<double>::quiet_NaN()
                                              : typed->Value(i));
        }
    }
    return values;
}

arrow::Result<std::vector<std::optional<std::string>>> AnalyticsDataFrame::string_column(
    const std::string& column_name) const {

    if (!table_) {
        return arrow::Status::Invalid("No data available");
    }
    auto column = table_->GetColumnByName(column_name);
    if (!column) {
        return arrow::Status::Invalid("Column not found: ", column_name);
    }
    ARROW_ASSIGN_OR_RAISE(auto strings, cast_column(column, arrow::utf8()));

    std::vector<std::optional<std::string>> values;
    values.reserve(static_cast<std::size_t>(strings->length()));
    for (const auto& chunk : strings->chunks()) {
        auto typed = std::static_pointer_cast<arrow::StringArray>(chunk);
        for (int64_t i = 0; i < typed->length(); ++i) {
            if (typed->IsNull(i)) {
                values.emplace_back(std::nullopt);
            } else {
                values.emplace_back(typed->GetString(i));
            }
        }
    }
    return values;
}

arrow::Result<std::vector<int64_t>> AnalyticsDataFrame::timestamps() const {
    if (!timestamp_column_) {
        return arrow::Status::Invalid("Timestamp column not set");
    }
    auto column = table_ ? table_->GetColumnByName(*timestamp_column_) : nullptr;
    if (!column) {
        return arrow::Status::Invalid("Timestamp column not found: ", *timestamp_column_);
    }
    ARROW_ASSIGN_OR_RAISE(auto ts_int64, cast_column(column, arrow::int64()));
    ARROW_ASSIGN_OR_RAISE(auto view, ColumnView<int64_t>::from_chunked_array(ts_int64, *timestamp_column_));
    if (view.null_count() > 0) {
        return arrow::Status::Invalid("Timestamp column '", *timestamp_column_, "' contains nulls");
    }
    return std::vector<int64_t>(view.begin(), view.end());
}

void AnalyticsDataFrame::set_timestamp_column(const std::string& column_name) {
    timestamp_column_ = column_name;
}

int64_t AnalyticsDataFrame::num_rows() const {
    return table_ ? table_->num_rows() : 0;
}

int64_t AnalyticsDataFrame::num_columns() const {
    return table_ ? table_->num_columns() : 0;
}

std::vector<std::string> AnalyticsDataFrame::column_names() const {
    if (!table_) {
        return {};
    }
    return table_->ColumnNames();
}

bool AnalyticsDataFrame::has_column(const std::string& column_name) const {
    return table_ && table_->schema()->GetFieldIndex(column_name) != -1;
}

AnalyticsDataFrame AnalyticsDataFrame::create_from_table(
    std::shared_ptr<arrow::Table> table) const {
    AnalyticsDataFrame result(std::move(table));
    result.timestamp_column_ = timestamp_column_;
    return result;
}

} // namespace signalflow
