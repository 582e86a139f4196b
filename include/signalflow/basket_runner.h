#pragma once

#include "analytics_dataframe.h"
#include "pipeline_config.h"
#include "signal_pipeline.h"
#include "technical_signals.h"

#include <arrow/result.h>
#include <arrow/table.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace signalflow {

struct SymbolResult {
    std::string symbol;
    std::shared_ptr<arrow::Table> table;  // null when the symbol failed
    std::string error;

    bool ok() const { return table != nullptr; }
};

struct FinalSignal {
    int64_t timestamp = 0;
    std::string symbol;
    double close = 0.0;
    double rsi = 0.0;
    TechnicalLabel signal = TechnicalLabel::Hold;
};

// Latest bar of one symbol with its indicator values.
struct IndicatorSnapshot {
    int64_t timestamp = 0;
    std::string symbol;
    double close = 0.0;
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
    double rsi = 0.0;
};

struct SignalSummary {
    std::vector<FinalSignal> recent;  // newest first, at most the requested limit
    std::size_t total = 0;
    std::size_t buys = 0;
    std::size_t sells = 0;
};

// Runs the signal pipeline over a list of symbols. A failing symbol is
// logged and reported in its SymbolResult; the others still run.
class BasketRunner {
public:
    using BarLoader = std::function<arrow::Result<AnalyticsDataFrame>(const std::string& symbol)>;

    // Loads bars from <data_directory>/<symbol>.csv.
    explicit BasketRunner(PipelineConfig config);
    BasketRunner(PipelineConfig config, BarLoader loader);

    std::vector<SymbolResult> run() const;
    std::vector<SymbolResult> run(const std::vector<std::string>& symbols) const;

    const PipelineConfig& config() const { return m_pipeline.config(); }

private:
    SymbolResult run_symbol(const std::string& symbol) const;

    SignalPipeline m_pipeline;
    BarLoader m_loader;
};

// Reads the symbol universe from a CSV file. Header names are reduced to
// their first whitespace-separated word before matching `column`; blank and
// null entries are skipped.
arrow::Result<std::vector<std::string>> load_symbol_list(const std::string& path,
                                                         const std::string& column = "SYMBOL");

// Concatenates the successful results, unifying their schemas.
arrow::Result<std::shared_ptr<arrow::Table>> combine_results(const std::vector<SymbolResult>& results);

// Rows whose structural and MACD labels agree, restricted to bars after
// `since` (unix seconds) when given. Counts cover every such row; `recent`
// keeps the newest `limit`.
arrow::Result<SignalSummary> collect_final_signals(const std::vector<SymbolResult>& results,
                                                   const PipelineConfig& config);

// Last row of every successful result that has rows, in result order.
// Requires the technical columns.
arrow::Result<std::vector<IndicatorSnapshot>> collect_latest_indicators(
    const std::vector<SymbolResult>& results, const PipelineConfig& config);

} // namespace signalflow
