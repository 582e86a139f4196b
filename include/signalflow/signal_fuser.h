#pragma once

#include "change_point.h"
#include "pivot_detector.h"
#include "time_series.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace signalflow {

enum class SignalLabel {
    Hold,
    Buy,
    Sell
};

// "hold", "buy", "sell"
const char* to_string(SignalLabel label);

// Buy only when buy-eligible alone, sell only when sell-eligible alone.
// Both or neither is Hold.
SignalLabel resolve_label(bool buyEligible, bool sellEligible) noexcept;

struct SignalConfig {
    std::size_t leftLookback = 5;
    std::size_t rightLookback = 5;
    double changePenalty = 20.0;
    CostModel changeModel = CostModel::Rbf;
    std::size_t proximityWindow = 8;

    // Full pivot + change-point pipeline.
    static SignalConfig combined();
    // Shorter windows and a lower penalty.
    static SignalConfig light();
    // "combined" or "light"; throws std::invalid_argument otherwise.
    static SignalConfig preset(const std::string& name);

    bool validate(std::string* error = nullptr) const;
};

// One row per input bar.
struct SignalFrame {
    std::vector<int64_t> timestamps;
    std::vector<double> price;
    std::vector<double> oscillator;
    std::vector<std::optional<double>> pivotHigh;
    std::vector<std::optional<double>> pivotLow;
    std::vector<uint8_t> changePoint;
    std::vector<bool> buySignal;
    std::vector<bool> sellSignal;
    std::vector<SignalLabel> signal;

    std::size_t size() const noexcept { return timestamps.size(); }

    // Rows labelled Buy or Sell, in order.
    std::vector<std::size_t> active_rows() const;
};

class SignalFuser {
public:
    explicit SignalFuser(SignalConfig config, ChangePointDetector detector = ChangePointDetector());

    // Pivots come from `oscillator`, change points from `price`. Both series
    // must share the same timestamps.
    SignalFrame fuse(const TimeSeries& price, const TimeSeries& oscillator) const;

    const SignalConfig& config() const { return m_config; }

private:
    SignalConfig m_config;
    ChangePointDetector m_detector;
};

} // namespace signalflow
