#include "signalflow/technical_signals.h"

#include "signalflow/indicators.h"

#include <arrow/builder.h>

#include <cmath>

namespace signalflow {

namespace {

arrow::Result<std::shared_ptr<arrow::Array>> to_array(const std::vector<double>& values)
{
    arrow::DoubleBuilder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(values.size())));
    for (const double v : values) {
        if (std::isnan(v)) {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
        } else {
            ARROW_RETURN_NOT_OK(builder.Append(v));
        }
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

arrow::Result<std::shared_ptr<arrow::Array>> to_array(
    const std::vector<std::optional<TechnicalLabel>>& labels)
{
    arrow::StringBuilder builder;
    for (const auto& label : labels) {
        if (label) {
            ARROW_RETURN_NOT_OK(builder.Append(to_string(*label)));
        } else {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
        }
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

} // namespace

const char* to_string(TechnicalLabel label)
{
    switch (label) {
        case TechnicalLabel::Buy:  return "Buy";
        case TechnicalLabel::Sell: return "Sell";
        case TechnicalLabel::Hold: return "Hold";
    }
    return "Hold";
}

std::optional<TechnicalLabel> parse_technical_label(const std::string& text)
{
    if (text == "Buy") return TechnicalLabel::Buy;
    if (text == "Sell") return TechnicalLabel::Sell;
    if (text == "Hold") return TechnicalLabel::Hold;
    return std::nullopt;
}

TechnicalLabel rsi_label(double rsi, const TechnicalThresholds& thresholds)
{
    if (rsi < thresholds.rsiOversold) return TechnicalLabel::Buy;
    if (rsi > thresholds.rsiOverbought) return TechnicalLabel::Sell;
    return TechnicalLabel::Hold;
}

std::optional<TechnicalLabel> macd_label(double macd, double signal, double histogram, double rsi,
                                         const TechnicalThresholds& thresholds)
{
    if (macd > thresholds.macdLevel && macd > signal &&
        histogram > thresholds.histogramLevel && rsi > thresholds.buyRsiFloor) {
        return TechnicalLabel::Buy;
    }
    if (macd < -thresholds.macdLevel && macd < signal &&
        histogram < -thresholds.histogramLevel && rsi < thresholds.sellRsiCeiling) {
        return TechnicalLabel::Sell;
    }
    return std::nullopt;
}

std::optional<TechnicalLabel> final_signal(std::optional<SignalLabel> structural,
                                           std::optional<TechnicalLabel> macdSignal)
{
    if (!structural || !macdSignal) {
        return std::nullopt;
    }
    if (*structural == SignalLabel::Buy && *macdSignal == TechnicalLabel::Buy) {
        return TechnicalLabel::Buy;
    }
    if (*structural == SignalLabel::Sell && *macdSignal == TechnicalLabel::Sell) {
        return TechnicalLabel::Sell;
    }
    return std::nullopt;
}

arrow::Result<AnalyticsDataFrame> append_technical_columns(
    const AnalyticsDataFrame& bars,
    const std::string& close_column,
    const TechnicalThresholds& thresholds)
{
    ARROW_ASSIGN_OR_RAISE(auto close, bars.numeric_column(close_column));

    const MacdSeries macdSeries = macd(close);
    const std::vector<double> rsiSeries = rsi(close);

    std::vector<std::optional<TechnicalLabel>> rsiLabels(close.size());
    std::vector<std::optional<TechnicalLabel>> macdLabels(close.size());
    for (std::size_t i = 0; i < close.size(); ++i) {
        rsiLabels[i] = rsi_label(rsiSeries[i], thresholds);
        macdLabels[i] = macd_label(macdSeries.macd[i], macdSeries.signal[i],
                                   macdSeries.histogram[i], rsiSeries[i], thresholds);
    }

    using namespace technical_columns;
    const std::vector<std::pair<const char*, const std::vector<double>*>> numeric = {
        {kEma12, &macdSeries.fast},
        {kEma26, &macdSeries.slow},
        {kMacd, &macdSeries.macd},
        {kSignal, &macdSeries.signal},
        {kMacdHist, &macdSeries.histogram},
        {kRsi, &rsiSeries},
    };

    ARROW_ASSIGN_OR_RAISE(auto result, bars.slice_by_row_index(0, bars.num_rows()));
    for (const auto& [name, values] : numeric) {
        ARROW_ASSIGN_OR_RAISE(auto array, to_array(*values));
        ARROW_ASSIGN_OR_RAISE(result, result.with_column(name, array));
    }

    ARROW_ASSIGN_OR_RAISE(auto rsiArray, to_array(rsiLabels));
    ARROW_ASSIGN_OR_RAISE(result, result.with_column(kRsiSignal, rsiArray));
    ARROW_ASSIGN_OR_RAISE(auto macdArray, to_array(macdLabels));
    ARROW_ASSIGN_OR_RAISE(result, result.with_column(kMacdSignals, macdArray));
    return result;
}

} // namespace signalflow
