#include "signalflow/signal_fuser.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace signalflow {

const char* to_string(SignalLabel label) {
    switch (label) {
        case SignalLabel::Buy:  return "buy";
        case SignalLabel::Sell: return "sell";
        case SignalLabel::Hold: return "hold";
    }
    return "hold";
}

SignalLabel resolve_label(bool buyEligible, bool sellEligible) noexcept {
    if (buyEligible && !sellEligible) return SignalLabel::Buy;
    if (sellEligible && !buyEligible) return SignalLabel::Sell;
    return SignalLabel::Hold;
}

SignalConfig SignalConfig::combined() {
    SignalConfig config;
    config.leftLookback = 5;
    config.rightLookback = 5;
    config.changePenalty = 20.0;
    config.changeModel = CostModel::Rbf;
    config.proximityWindow = 8;
    return config;
}

SignalConfig SignalConfig::light() {
    SignalConfig config;
    config.leftLookback = 3;
    config.rightLookback = 3;
    config.changePenalty = 10.0;
    config.changeModel = CostModel::Rbf;
    config.proximityWindow = 5;
    return config;
}

SignalConfig SignalConfig::preset(const std::string& name) {
    if (name == "combined") return combined();
    if (name == "light") return light();
    throw std::invalid_argument("Unknown signal preset: " + name);
}

bool SignalConfig::validate(std::string* error) const {
    if (!std::isfinite(changePenalty) || changePenalty < 0.0) {
        if (error) {
            *error = "change_penalty must be a finite, non-negative number";
        }
        return false;
    }
    if (error) {
        error->clear();
    }
    return true;
}

std::vector<std::size_t> SignalFrame::active_rows() const {
    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < signal.size(); ++i) {
        if (signal[i] != SignalLabel::Hold) {
            rows.push_back(i);
        }
    }
    return rows;
}

SignalFuser::SignalFuser(SignalConfig config, ChangePointDetector detector)
    : m_config(config), m_detector(std::move(detector)) {
    std::string error;
    if (!m_config.validate(&error)) {
        throw std::invalid_argument(error);
    }
}

SignalFrame SignalFuser::fuse(const TimeSeries& price, const TimeSeries& oscillator) const {
    std::string error;
    if (!price.validate(&error)) {
        throw std::invalid_argument("Price series: " + error);
    }
    if (!oscillator.validate(&error)) {
        throw std::invalid_argument("Oscillator series: " + error);
    }
    if (price.timestamps != oscillator.timestamps) {
        throw std::invalid_argument("Price and oscillator series must share the same timestamps");
    }

    const std::size_t n = price.size();
    SignalFrame frame;
    frame.timestamps = price.timestamps;
    frame.price = price.values;
    frame.oscillator = oscillator.values;

    frame.pivotHigh = detect_pivots(oscillator, m_config.leftLookback, m_config.rightLookback, PivotKind::High);
    frame.pivotLow = detect_pivots(oscillator, m_config.leftLookback, m_config.rightLookback, PivotKind::Low);

    frame.changePoint.assign(n, 0);
    const auto changePoints = m_detector.detect_change_points(price.view(), m_config.changePenalty,
                                                              m_config.changeModel);
    for (const std::size_t index : changePoints) {
        if (index < n) {
            frame.changePoint[index] = 1;
        }
    }

    // prefix[i] = number of change points in rows [0, i).
    std::vector<std::size_t> prefix(n + 1, 0);
    for (std::size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + frame.changePoint[i];
    }

    const std::size_t window = m_config.proximityWindow;
    frame.buySignal.assign(n, false);
    frame.sellSignal.assign(n, false);
    frame.signal.assign(n, SignalLabel::Hold);
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t first = (i > window) ? i - window : 0;
        const std::size_t last = (window >= n - 1 - i) ? n - 1 : i + window;
        const bool nearChangePoint = prefix[last + 1] - prefix[first] > 0;
        if (nearChangePoint) {
            frame.buySignal[i] = frame.pivotLow[i].has_value();
            frame.sellSignal[i] = frame.pivotHigh[i].has_value();
        }
        frame.signal[i] = resolve_label(frame.buySignal[i], frame.sellSignal[i]);
    }
    return frame;
}

} // namespace signalflow
