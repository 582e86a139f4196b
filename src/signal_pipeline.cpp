#include "signalflow/signal_pipeline.h"

#include "signalflow/signal_merge.h"
#include "signalflow/simple_logger.h"
#include "signalflow/technical_signals.h"

#include <arrow/builder.h>

#include <stdexcept>

namespace signalflow {

namespace {

ChangePointDetector make_detector(const SolverSettings& solver) {
    if (solver.min_size < 1 || solver.jump < 1) {
        throw std::invalid_argument("solver min_size and jump must be >= 1");
    }
    return ChangePointDetector(pelt_solver_factory(solver.min_size, solver.jump));
}

arrow::Result<std::shared_ptr<arrow::Array>> repeated_string(const std::string& value, int64_t length) {
    arrow::StringBuilder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(length));
    for (int64_t i = 0; i < length; ++i) {
        ARROW_RETURN_NOT_OK(builder.Append(value));
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

} // namespace

SignalPipeline::SignalPipeline(PipelineConfig config)
    : m_config(std::move(config)),
      m_fuser(m_config.signal, make_detector(m_config.solver)) {}

arrow::Result<AnalyticsDataFrame> SignalPipeline::run(const AnalyticsDataFrame& bars,
                                                      const std::string& symbol) const {
    ARROW_ASSIGN_OR_RAISE(auto df, bars.with_unix_timestamp(m_config.timestamp_column, kUnixTimeColumn,
                                                            m_config.timestamp_format));
    ARROW_ASSIGN_OR_RAISE(auto timestamps, df.timestamps());
    ARROW_ASSIGN_OR_RAISE(auto close, df.numeric_column(m_config.close_column));

    if (m_config.technical_signals) {
        ARROW_ASSIGN_OR_RAISE(df, append_technical_columns(df, m_config.close_column));
    }
    if (!symbol.empty()) {
        ARROW_ASSIGN_OR_RAISE(auto symbols, repeated_string(symbol, df.num_rows()));
        ARROW_ASSIGN_OR_RAISE(df, df.with_column(kSymbolColumn, symbols));
    }

    // Pivots are taken on the close itself.
    const TimeSeries price(std::move(timestamps), std::move(close));
    SignalFrame frame;
    try {
        frame = m_fuser.fuse(price, price);
    } catch (const std::invalid_argument& e) {
        return arrow::Status::Invalid(symbol.empty() ? "" : symbol + ": ", e.what());
    }

    ARROW_ASSIGN_OR_RAISE(auto fused, signal_frame_to_table(frame, true));

    MergeOptions merge_options;
    merge_options.timestamp_column = kUnixTimeColumn;
    merge_options.output_column = m_config.output_column;
    ARROW_ASSIGN_OR_RAISE(auto merged, merge_signals(df, fused, merge_options));

    SimpleLogger::Log((symbol.empty() ? std::string("series") : symbol) + ": " +
                      std::to_string(frame.size()) + " bars, " +
                      std::to_string(fused.num_rows()) + " active signals");
    return merged;
}

} // namespace signalflow
