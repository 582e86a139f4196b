#pragma once

#include "analytics_dataframe.h"
#include "pipeline_config.h"
#include "signal_fuser.h"

#include <arrow/result.h>

#include <string>

namespace signalflow {

// int64 unix-seconds copy of the timestamp column carried by pipeline output.
inline constexpr const char* kUnixTimeColumn = "unix_time";
inline constexpr const char* kSymbolColumn = "Stock";

// Annotates one symbol's bars with the structural signal and, when
// configured, the MACD/RSI columns.
class SignalPipeline {
public:
    // Throws std::invalid_argument for an invalid signal or solver setup.
    explicit SignalPipeline(PipelineConfig config);

    // Returns the bars plus unix_time, the technical columns, Stock (when
    // `symbol` is non-empty) and the fused columns. Row count and order are
    // those of `bars`.
    arrow::Result<AnalyticsDataFrame> run(const AnalyticsDataFrame& bars,
                                          const std::string& symbol = "") const;

    const PipelineConfig& config() const { return m_config; }

private:
    PipelineConfig m_config;
    SignalFuser m_fuser;
};

} // namespace signalflow
