#pragma once

#include "analytics_dataframe.h"
#include "signal_fuser.h"

#include <arrow/result.h>

#include <optional>
#include <string>

namespace signalflow {

enum class TechnicalLabel {
    Hold,
    Buy,
    Sell
};

// "Hold", "Buy", "Sell"
const char* to_string(TechnicalLabel label);
std::optional<TechnicalLabel> parse_technical_label(const std::string& text);

// Column names written by append_technical_columns().
namespace technical_columns {
inline constexpr const char* kEma12 = "EMA12";
inline constexpr const char* kEma26 = "EMA26";
inline constexpr const char* kMacd = "MACD";
inline constexpr const char* kSignal = "Signal";
inline constexpr const char* kMacdHist = "MACD_Hist";
inline constexpr const char* kRsi = "RSI";
inline constexpr const char* kRsiSignal = "rsi_signal";
inline constexpr const char* kMacdSignals = "macd_signals";
} // namespace technical_columns

struct TechnicalThresholds {
    double rsiOversold = 30.0;
    double rsiOverbought = 65.0;
    double macdLevel = 1.0;
    double histogramLevel = 1.0;
    double buyRsiFloor = 40.0;
    double sellRsiCeiling = 60.0;
};

// Buy below the oversold level, Sell above the overbought level, else Hold.
TechnicalLabel rsi_label(double rsi, const TechnicalThresholds& thresholds = {});

// Buy on a strong bullish MACD with RSI above the floor, Sell on the mirror
// condition, nothing otherwise. NaN inputs never qualify.
std::optional<TechnicalLabel> macd_label(double macd, double signal, double histogram, double rsi,
                                         const TechnicalThresholds& thresholds = {});

// Buy when the structural signal is buy and the MACD label is Buy; Sell
// symmetric.
std::optional<TechnicalLabel> final_signal(std::optional<SignalLabel> structural,
                                           std::optional<TechnicalLabel> macdSignal);

// Appends EMA12, EMA26, MACD, Signal, MACD_Hist, RSI, rsi_signal and
// macd_signals computed from `close_column`. NaN values are written as null.
arrow::Result<AnalyticsDataFrame> append_technical_columns(
    const AnalyticsDataFrame& bars,
    const std::string& close_column,
    const TechnicalThresholds& thresholds = {});

} // namespace signalflow
