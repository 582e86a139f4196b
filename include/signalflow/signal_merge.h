#pragma once

#include "analytics_dataframe.h"
#include "signal_fuser.h"

#include <arrow/result.h>

#include <string>

namespace signalflow {

// Column names of a fused-signal table.
namespace fused_columns {
inline constexpr const char* kTimestamp = "timestamp";
inline constexpr const char* kPrice = "price";
inline constexpr const char* kOscillator = "osc";
inline constexpr const char* kPivotHigh = "pvtHigh";
inline constexpr const char* kPivotLow = "pvtLow";
inline constexpr const char* kChangePoint = "change_point";
inline constexpr const char* kBuySignal = "buy_signal";
inline constexpr const char* kSellSignal = "sell_signal";
inline constexpr const char* kSignal = "signal";
} // namespace fused_columns

struct MergeOptions {
    // int64 unix-seconds column of the original table.
    std::string timestamp_column = "Datetime";
    std::string output_column = "cpd_pvt_signals";
};

// Arrow table with one row per frame row. With `active_only` only rows
// labelled buy or sell are kept. Absent pivots are nulls.
arrow::Result<AnalyticsDataFrame> signal_frame_to_table(const SignalFrame& frame,
                                                        bool active_only = false);

// Left join of `fused` onto `original` by timestamp. Every original row is
// kept once and in order; fused columns are null where no timestamp
// matches. The fused timestamp key is not repeated, buy_signal and
// sell_signal are dropped, and signal becomes `options.output_column`.
//
// Duplicate fused timestamps and fused column names that already exist in
// `original` fail with an Invalid status prefixed "MalformedInput".
arrow::Result<AnalyticsDataFrame> merge_signals(const AnalyticsDataFrame& original,
                                                const AnalyticsDataFrame& fused,
                                                const MergeOptions& options = MergeOptions());

} // namespace signalflow
