#include "signalflow/signalflow.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace signalflow;

namespace {

void print_dataframe(const AnalyticsDataFrame& df, const std::string& title, int max_rows = 10) {
    std::cout << "\n--- " << title << " ---\n";
    auto table = df.get_table();
    if (!table || df.num_rows() == 0) {
        std::cout << "(DataFrame is empty)\n";
        return;
    }

    auto column_names = table->schema()->field_names();
    for (const auto& name : column_names) {
        std::cout << std::left << std::setw(18) << name;
    }
    std::cout << "\n" << std::string(column_names.size() * 18, '-') << "\n";

    for (int64_t i = 0; i < std::min(static_cast<int64_t>(max_rows), table->num_rows()); ++i) {
        for (int j = 0; j < table->num_columns(); ++j) {
            auto scalar_result = table->column(j)->GetScalar(i);
            if (!scalar_result.ok()) {
                std::cout << std::left << std::setw(18) << "[error]";
            } else if (scalar_result.ValueOrDie()->is_valid) {
                std::cout << std::left << std::setw(18) << scalar_result.ValueOrDie()->ToString();
            } else {
                std::cout << std::left << std::setw(18) << "NULL";
            }
        }
        std::cout << "\n";
    }

    if (table->num_rows() > max_rows) {
        std::cout << "...\n(" << table->num_rows() << " total rows)\n";
    }
}

void print_indicators(const std::vector<IndicatorSnapshot>& snapshots) {
    std::cout << "\nLatest Indicators\n";
    std::cout << std::left << std::setw(18) << "Date" << std::setw(14) << "Stock"
              << std::setw(12) << "Close" << std::setw(10) << "MACD" << std::setw(10) << "Signal"
              << std::setw(11) << "MACD_Hist" << "RSI\n";
    for (const auto& snapshot : snapshots) {
        std::cout << std::left << std::setw(18) << FormatUtcDateTime(snapshot.timestamp, "%d-%b-%y %H:%M")
                  << std::setw(14) << snapshot.symbol
                  << std::setw(12) << std::fixed << std::setprecision(2) << snapshot.close
                  << std::setw(10) << snapshot.macd
                  << std::setw(10) << snapshot.signal
                  << std::setw(11) << snapshot.histogram
                  << snapshot.rsi << "\n";
    }
}

void print_summary(const SignalSummary& summary, std::size_t limit) {
    std::cout << "\nRecent Signals (Last " << limit << ")\n";
    std::cout << "Total Signals: " << summary.total
              << " | Buy Signals: " << summary.buys
              << " | Sell Signals: " << summary.sells << "\n";

    std::cout << std::left << std::setw(18) << "Datetime" << std::setw(14) << "Stock"
              << std::setw(12) << "Close" << std::setw(10) << "RSI" << "final_signal\n";
    for (const auto& signal : summary.recent) {
        std::cout << std::left << std::setw(18) << FormatUtcDateTime(signal.timestamp, "%d-%b-%y %H:%M")
                  << std::setw(14) << signal.symbol
                  << std::setw(12) << std::fixed << std::setprecision(2) << signal.close
                  << std::setw(10) << signal.rsi
                  << to_string(signal.signal) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "signalflow " << signalflow::VERSION << "\n";

    auto init_status = signalflow::initialize();
    if (!init_status.ok()) {
        std::cerr << "Error: Failed to initialize Arrow compute functions. "
                  << init_status.ToString() << std::endl;
        return 1;
    }

    const std::string config_path = argc > 1 ? argv[1] : "signalflow.json";
    PipelineConfig config;
    std::string error;
    if (!LoadPipelineConfig(config_path, &config, &error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (!config.symbols_file.empty()) {
        auto symbols_result = load_symbol_list(config.symbols_file, config.symbol_column);
        if (!symbols_result.ok()) {
            std::cerr << "Error: " << symbols_result.status().ToString() << std::endl;
            return 1;
        }
        config.symbols = std::move(symbols_result).ValueOrDie();
    }
    for (int i = 2; i < argc; ++i) {
        if (i == 2) {
            config.symbols.clear();
        }
        config.symbols.emplace_back(argv[i]);
    }
    if (config.symbols.empty()) {
        std::cerr << "Error: no symbols configured" << std::endl;
        return 1;
    }

    std::vector<SymbolResult> results;
    try {
        BasketRunner runner(config);
        results = runner.run();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const auto succeeded = static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
                                      [](const SymbolResult& r) { return r.ok(); }));
    SimpleLogger::Log(std::to_string(succeeded) + " of " +
                      std::to_string(results.size()) + " symbols processed");

    auto combined_result = combine_results(results);
    if (!combined_result.ok()) {
        std::cerr << "Error: " << combined_result.status().ToString() << std::endl;
        return 1;
    }
    AnalyticsDataFrame combined(combined_result.ValueOrDie());
    combined.set_timestamp_column(kUnixTimeColumn);

    if (config.since) {
        auto window_result = combined.select_rows_by_timestamp(*config.since + 1, std::numeric_limits<int64_t>::max());
        if (!window_result.ok()) {
            std::cerr << "Error: " << window_result.status().ToString() << std::endl;
            return 1;
        }
        combined = std::move(window_result).ValueOrDie();
    }

    auto output_result = combined.drop_columns({kUnixTimeColumn});
    if (!output_result.ok()) {
        std::cerr << "Error: " << output_result.status().ToString() << std::endl;
        return 1;
    }
    auto output = std::move(output_result).ValueOrDie();
    auto write_status = DataFrameIO::write_csv(output, config.output_path);
    if (!write_status.ok()) {
        std::cerr << "Error: Failed to write '" << config.output_path << "'. "
                  << write_status.ToString() << std::endl;
        return 1;
    }
    print_dataframe(output, "Wrote " + config.output_path, 5);

    if (!config.technical_signals) {
        return 0;
    }
    auto indicators_result = collect_latest_indicators(results, config);
    if (!indicators_result.ok()) {
        std::cerr << "Error: " << indicators_result.status().ToString() << std::endl;
        return 1;
    }
    print_indicators(indicators_result.ValueOrDie());

    auto summary_result = collect_final_signals(results, config);
    if (!summary_result.ok()) {
        std::cerr << "Error: " << summary_result.status().ToString() << std::endl;
        return 1;
    }
    print_summary(summary_result.ValueOrDie(), config.recent_limit);
    return 0;
}
