#include "signalflow/signal_merge.h"

#include <arrow/array/util.h>
#include <arrow/builder.h>
#include <arrow/compute/api.h>
#include <arrow/compute/cast.h>
#include <arrow/datum.h>

#include <unordered_map>

namespace signalflow {

namespace {

arrow::Result<std::shared_ptr<arrow::Array>> finish(arrow::ArrayBuilder& builder) {
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

arrow::Result<std::shared_ptr<arrow::Int64Array>> key_column(const AnalyticsDataFrame& df,
                                                             const std::string& name) {
    auto table = df.get_table();
    auto column = table ? table->GetColumnByName(name) : nullptr;
    if (!column) {
        return arrow::Status::Invalid("MalformedInput: timestamp column '", name, "' not found");
    }

    arrow::compute::CastOptions cast_opts;
    cast_opts.to_type = arrow::int64();
    ARROW_ASSIGN_OR_RAISE(auto cast, arrow::compute::Cast(arrow::Datum(column), cast_opts));

    std::shared_ptr<arrow::Array> combined;
    const auto& chunks = cast.chunked_array()->chunks();
    if (chunks.empty()) {
        ARROW_ASSIGN_OR_RAISE(combined, arrow::MakeEmptyArray(arrow::int64()));
    } else if (chunks.size() == 1) {
        combined = chunks.front();
    } else {
        ARROW_ASSIGN_OR_RAISE(combined, arrow::Concatenate(chunks));
    }
    return std::static_pointer_cast<arrow::Int64Array>(combined);
}

} // namespace

arrow::Result<AnalyticsDataFrame> signal_frame_to_table(const SignalFrame& frame, bool active_only) {
    std::vector<std::size_t> rows;
    if (active_only) {
        rows = frame.active_rows();
    } else {
        rows.resize(frame.size());
        for (std::size_t i = 0; i < rows.size(); ++i) {
            rows[i] = i;
        }
    }

    arrow::Int64Builder timestamp_builder;
    arrow::DoubleBuilder price_builder;
    arrow::DoubleBuilder osc_builder;
    arrow::DoubleBuilder high_builder;
    arrow::DoubleBuilder low_builder;
    arrow::Int64Builder change_builder;
    arrow::BooleanBuilder buy_builder;
    arrow::BooleanBuilder sell_builder;
    arrow::StringBuilder signal_builder;

    for (const std::size_t row : rows) {
        ARROW_RETURN_NOT_OK(timestamp_builder.Append(frame.timestamps[row]));
        ARROW_RETURN_NOT_OK(price_builder.Append(frame.price[row]));
        ARROW_RETURN_NOT_OK(osc_builder.Append(frame.oscillator[row]));
        if (frame.pivotHigh[row]) {
            ARROW_RETURN_NOT_OK(high_builder.Append(*frame.pivotHigh[row]));
        } else {
            ARROW_RETURN_NOT_OK(high_builder.AppendNull());
        }
        if (frame.pivotLow[row]) {
            ARROW_RETURN_NOT_OK(low_builder.Append(*frame.pivotLow[row]));
        } else {
            ARROW_RETURN_NOT_OK(low_builder.AppendNull());
        }
        ARROW_RETURN_NOT_OK(change_builder.Append(frame.changePoint[row]));
        ARROW_RETURN_NOT_OK(buy_builder.Append(frame.buySignal[row]));
        ARROW_RETURN_NOT_OK(sell_builder.Append(frame.sellSignal[row]));
        ARROW_RETURN_NOT_OK(signal_builder.Append(to_string(frame.signal[row])));
    }

    using namespace fused_columns;
    auto schema = arrow::schema({
        arrow::field(kTimestamp, arrow::int64(), false),
        arrow::field(kPrice, arrow::float64()),
        arrow::field(kOscillator, arrow::float64()),
        arrow::field(kPivotHigh, arrow::float64()),
        arrow::field(kPivotLow, arrow::float64()),
        arrow::field(kChangePoint, arrow::int64()),
        arrow::field(kBuySignal, arrow::boolean()),
        arrow::field(kSellSignal, arrow::boolean()),
        arrow::field(kSignal, arrow::utf8()),
    });

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    ARROW_ASSIGN_OR_RAISE(auto timestamps, finish(timestamp_builder));
    arrays.push_back(timestamps);
    ARROW_ASSIGN_OR_RAISE(auto price, finish(price_builder));
    arrays.push_back(price);
    ARROW_ASSIGN_OR_RAISE(auto osc, finish(osc_builder));
    arrays.push_back(osc);
    ARROW_ASSIGN_OR_RAISE(auto high, finish(high_builder));
    arrays.push_back(high);
    ARROW_ASSIGN_OR_RAISE(auto low, finish(low_builder));
    arrays.push_back(low);
    ARROW_ASSIGN_OR_RAISE(auto change, finish(change_builder));
    arrays.push_back(change);
    ARROW_ASSIGN_OR_RAISE(auto buy, finish(buy_builder));
    arrays.push_back(buy);
    ARROW_ASSIGN_OR_RAISE(auto sell, finish(sell_builder));
    arrays.push_back(sell);
    ARROW_ASSIGN_OR_RAISE(auto signal, finish(signal_builder));
    arrays.push_back(signal);

    AnalyticsDataFrame df(arrow::Table::Make(schema, arrays, static_cast<int64_t>(rows.size())));
    df.set_timestamp_column(kTimestamp);
    return df;
}

arrow::Result<AnalyticsDataFrame> merge_signals(const AnalyticsDataFrame& original,
                                                const AnalyticsDataFrame& fused,
                                                const MergeOptions& options) {
    if (!original.get_table()) {
        return arrow::Status::Invalid("MalformedInput: original table is empty");
    }
    if (!fused.get_table()) {
        return arrow::Status::Invalid("MalformedInput: fused table is empty");
    }

    ARROW_ASSIGN_OR_RAISE(auto fused_keys, key_column(fused, fused_columns::kTimestamp));
    std::unordered_map<int64_t, int64_t> row_by_timestamp;
    row_by_timestamp.reserve(static_cast<std::size_t>(fused_keys->length()));
    for (int64_t i = 0; i < fused_keys->length(); ++i) {
        if (fused_keys->IsNull(i)) {
            return arrow::Status::Invalid("MalformedInput: fused table has a null timestamp at row ", i);
        }
        if (!row_by_timestamp.emplace(fused_keys->Value(i), i).second) {
            return arrow::Status::Invalid("MalformedInput: duplicate timestamp ", fused_keys->Value(i),
                                          " in fused table");
        }
    }

    ARROW_ASSIGN_OR_RAISE(auto original_keys, key_column(original, options.timestamp_column));
    arrow::Int64Builder take_builder;
    ARROW_RETURN_NOT_OK(take_builder.Reserve(original_keys->length()));
    for (int64_t i = 0; i < original_keys->length(); ++i) {
        auto it = original_keys->IsNull(i) ? row_by_timestamp.end()
                                           : row_by_timestamp.find(original_keys->Value(i));
        if (it == row_by_timestamp.end()) {
            ARROW_RETURN_NOT_OK(take_builder.AppendNull());
        } else {
            ARROW_RETURN_NOT_OK(take_builder.Append(it->second));
        }
    }
    ARROW_ASSIGN_OR_RAISE(auto take_indices, finish(take_builder));

    auto fused_table = fused.get_table();
    AnalyticsDataFrame merged(original.get_table());
    if (original.timestamp_column()) {
        merged.set_timestamp_column(*original.timestamp_column());
    }

    for (int c = 0; c < fused_table->num_columns(); ++c) {
        const std::string& name = fused_table->field(c)->name();
        if (name == fused_columns::kTimestamp || name == fused_columns::kBuySignal ||
            name == fused_columns::kSellSignal) {
            continue;
        }
        const std::string output_name = (name == fused_columns::kSignal) ? options.output_column : name;
        if (merged.has_column(output_name)) {
            return arrow::Status::Invalid("MalformedInput: column '", output_name,
                                          "' exists in both tables");
        }

        ARROW_ASSIGN_OR_RAISE(auto taken, arrow::compute::Take(arrow::Datum(fused_table->column(c)),
                                                               arrow::Datum(take_indices)));
        auto chunks = taken.chunked_array()->chunks();
        std::shared_ptr<arrow::Array> values;
        if (chunks.empty()) {
            ARROW_ASSIGN_OR_RAISE(values, arrow::MakeEmptyArray(fused_table->field(c)->type()));
        } else if (chunks.size() == 1) {
            values = chunks.front();
        } else {
            ARROW_ASSIGN_OR_RAISE(values, arrow::Concatenate(chunks));
        }
        ARROW_ASSIGN_OR_RAISE(merged, merged.with_column(output_name, values));
    }

    if (merged.num_rows() != original.num_rows()) {
        return arrow::Status::Invalid("MalformedInput: merge changed the row count");
    }
    return merged;
}

} // namespace signalflow
