#include "signalflow/basket_runner.h"

#include "signalflow/dataframe_io.h"
#include "signalflow/simple_logger.h"

#include <algorithm>
#include <filesystem>
#include <future>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace signalflow {

namespace {

BasketRunner::BarLoader csv_loader(const PipelineConfig& config) {
    const std::filesystem::path directory = config.data_directory;
    return [directory](const std::string& symbol) {
        const auto path = directory / (symbol + ".csv");
        return DataFrameIO::read_csv(path.string());
    };
}

std::optional<SignalLabel> parse_structural(const std::optional<std::string>& text) {
    if (!text) return std::nullopt;
    if (*text == to_string(SignalLabel::Buy)) return SignalLabel::Buy;
    if (*text == to_string(SignalLabel::Sell)) return SignalLabel::Sell;
    return std::nullopt;
}

std::string first_word(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    in >> word;
    return word;
}

arrow::Status require_technical_columns(const AnalyticsDataFrame& df) {
    if (!df.has_column(technical_columns::kMacdSignals)) {
        return arrow::Status::Invalid("Final signals need the technical columns; enable technical_signals");
    }
    return arrow::Status::OK();
}

} // namespace

BasketRunner::BasketRunner(PipelineConfig config)
    : m_pipeline(config), m_loader(csv_loader(config)) {}

BasketRunner::BasketRunner(PipelineConfig config, BarLoader loader)
    : m_pipeline(std::move(config)), m_loader(std::move(loader)) {
    if (!m_loader) {
        throw std::invalid_argument("BasketRunner requires a bar loader");
    }
}

std::vector<SymbolResult> BasketRunner::run() const {
    return run(m_pipeline.config().symbols);
}

std::vector<SymbolResult> BasketRunner::run(const std::vector<std::string>& symbols) const {
    std::vector<SymbolResult> results(symbols.size());

    if (m_pipeline.config().parallel && symbols.size() > 1) {
        std::vector<std::future<void>> tasks;
        tasks.reserve(symbols.size());
        for (std::size_t i = 0; i < symbols.size(); ++i) {
            tasks.emplace_back(std::async(std::launch::async, [&, i]() {
                results[i] = run_symbol(symbols[i]);
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    } else {
        for (std::size_t i = 0; i < symbols.size(); ++i) {
            results[i] = run_symbol(symbols[i]);
        }
    }

    return results;
}

SymbolResult BasketRunner::run_symbol(const std::string& symbol) const {
    SymbolResult result;
    result.symbol = symbol;

    auto annotated = [&]() -> arrow::Result<AnalyticsDataFrame> {
        ARROW_ASSIGN_OR_RAISE(auto bars, m_loader(symbol));
        return m_pipeline.run(bars, symbol);
    }();

    if (!annotated.ok()) {
        result.error = annotated.status().ToString();
        SimpleLogger::Error("Error processing " + symbol + ": " + result.error);
        return result;
    }
    result.table = annotated.ValueOrDie().get_table();
    return result;
}

arrow::Result<std::vector<std::string>> load_symbol_list(const std::string& path,
                                                         const std::string& column) {
    ARROW_ASSIGN_OR_RAISE(auto df, DataFrameIO::read_csv(path));

    std::optional<std::string> match;
    for (const auto& name : df.column_names()) {
        if (first_word(name) == column) {
            match = name;
            break;
        }
    }
    if (!match) {
        return arrow::Status::Invalid("Symbol column '", column, "' not found in ", path);
    }

    ARROW_ASSIGN_OR_RAISE(auto values, df.string_column(*match));
    std::vector<std::string> symbols;
    for (const auto& value : values) {
        if (!value) continue;
        auto symbol = first_word(*value);
        if (!symbol.empty()) {
            symbols.push_back(std::move(symbol));
        }
    }
    return symbols;
}

arrow::Result<std::shared_ptr<arrow::Table>> combine_results(const std::vector<SymbolResult>& results) {
    std::vector<std::shared_ptr<arrow::Table>> tables;
    for (const auto& result : results) {
        if (result.ok()) {
            tables.push_back(result.table);
        }
    }
    if (tables.empty()) {
        return arrow::Status::Invalid("No symbol produced a result");
    }

    arrow::ConcatenateTablesOptions options;
    options.unify_schemas = true;
    return arrow::ConcatenateTables(tables, options);
}

arrow::Result<SignalSummary> collect_final_signals(const std::vector<SymbolResult>& results,
                                                   const PipelineConfig& config) {
    SignalSummary summary;
    std::vector<FinalSignal> signals;

    for (const auto& result : results) {
        if (!result.ok()) {
            continue;
        }
        AnalyticsDataFrame df(result.table);
        ARROW_RETURN_NOT_OK(require_technical_columns(df));

        ARROW_ASSIGN_OR_RAISE(auto timestamps, df.get_column_view<int64_t>(kUnixTimeColumn));
        ARROW_ASSIGN_OR_RAISE(auto structural, df.string_column(config.output_column));
        ARROW_ASSIGN_OR_RAISE(auto macd, df.string_column(technical_columns::kMacdSignals));
        ARROW_ASSIGN_OR_RAISE(auto close, df.numeric_column(config.close_column));
        ARROW_ASSIGN_OR_RAISE(auto rsi, df.numeric_column(technical_columns::kRsi));

        for (std::size_t i = 0; i < timestamps.size(); ++i) {
            const int64_t ts = timestamps.data()[i];
            if (config.since && ts <= *config.since) {
                continue;
            }
            std::optional<TechnicalLabel> macdLabel;
            if (macd[i]) {
                macdLabel = parse_technical_label(*macd[i]);
            }
            const auto label = final_signal(parse_structural(structural[i]), macdLabel);
            if (!label) {
                continue;
            }

            FinalSignal signal;
            signal.timestamp = ts;
            signal.symbol = result.symbol;
            signal.close = close[i];
            signal.rsi = rsi[i];
            signal.signal = *label;
            signals.push_back(std::move(signal));
        }
    }

    std::stable_sort(signals.begin(), signals.end(), [](const FinalSignal& a, const FinalSignal& b) {
        return a.timestamp > b.timestamp;
    });

    summary.total = signals.size();
    summary.buys = static_cast<std::size_t>(std::count_if(signals.begin(), signals.end(),
        [](const FinalSignal& s) { return s.signal == TechnicalLabel::Buy; }));
    summary.sells = static_cast<std::size_t>(std::count_if(signals.begin(), signals.end(),
        [](const FinalSignal& s) { return s.signal == TechnicalLabel::Sell; }));

    if (signals.size() > config.recent_limit) {
        signals.resize(config.recent_limit);
    }
    summary.recent = std::move(signals);
    return summary;
}

arrow::Result<std::vector<IndicatorSnapshot>> collect_latest_indicators(
    const std::vector<SymbolResult>& results, const PipelineConfig& config) {
    std::vector<IndicatorSnapshot> snapshots;

    for (const auto& result : results) {
        if (!result.ok() || result.table->num_rows() == 0) {
            continue;
        }
        AnalyticsDataFrame full(result.table);
        ARROW_RETURN_NOT_OK(require_technical_columns(full));
        ARROW_ASSIGN_OR_RAISE(auto last, full.slice_by_row_index(full.num_rows() - 1, full.num_rows()));

        IndicatorSnapshot snapshot;
        snapshot.symbol = result.symbol;
        ARROW_ASSIGN_OR_RAISE(auto timestamps, last.get_column_view<int64_t>(kUnixTimeColumn));
        snapshot.timestamp = timestamps[0];
        ARROW_ASSIGN_OR_RAISE(auto close, last.numeric_column(config.close_column));
        ARROW_ASSIGN_OR_RAISE(auto macd, last.numeric_column(technical_columns::kMacd));
        ARROW_ASSIGN_OR_RAISE(auto signal, last.numeric_column(technical_columns::kSignal));
        ARROW_ASSIGN_OR_RAISE(auto histogram, last.numeric_column(technical_columns::kMacdHist));
        ARROW_ASSIGN_OR_RAISE(auto rsi, last.numeric_column(technical_columns::kRsi));
        snapshot.close = close[0];
        snapshot.macd = macd[0];
        snapshot.signal = signal[0];
        snapshot.histogram = histogram[0];
        snapshot.rsi = rsi[0];
        snapshots.push_back(std::move(snapshot));
    }
    return snapshots;
}

} // namespace signalflow
