#include "pressure.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

PressureResult PressureAnalyzer::analyze(const std::vector<Bar>& bars, const OrderBookStats& book) const {
    PressureResult result;
    result.imbalance = book.imbalance;
    result.bid_ask_ratio = book.pressure_ratio;

    if (bars.empty()) {
        spdlog::warn("Pressure analysis skipped: no bars");
        return result;
    }

    // Flow share of traded value over the recent window
    const size_t flow_start = bars.size() > kFlowWindow ? bars.size() - kFlowWindow : 0;
    std::vector<double> inflow_ratios;
    for (size_t i = flow_start; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        inflow_ratios.push_back(bar.quote_volume > 0.0 ? bar.net_inflow / bar.quote_volume : 0.0);
    }

    PressureMetrics& m = result.metrics;
    m.avg_inflow_ratio = util::mean(inflow_ratios);
    m.volume_imbalance = book.imbalance;

    const double total_pressure = book.bid_pressure + book.ask_pressure;
    m.value_imbalance = total_pressure == 0.0 ? 0.0 : book.bid_pressure / total_pressure - 0.5;
    m.near_volume_imbalance = m.volume_imbalance;
    m.pressure_score = score(m);

    double strength = 0.0;
    if (m.pressure_score > kScoreThreshold) {
        strength = std::min(m.pressure_score * 5.0, 1.0);
        result.direction = strength > kStrongStrength ? PressureDirection::UpwardStrong
                                                      : PressureDirection::Upward;
    } else if (m.pressure_score < -kScoreThreshold) {
        strength = std::min(std::abs(m.pressure_score) * 5.0, 1.0);
        result.direction = strength > kStrongStrength ? PressureDirection::DownwardStrong
                                                      : PressureDirection::Downward;
    } else {
        strength = std::abs(m.pressure_score) * 5.0;
        result.direction = PressureDirection::Neutral;
    }
    result.confidence = strength;

    const size_t reversal_start = bars.size() > kReversalWindow ? bars.size() - kReversalWindow : 0;
    std::vector<double> recent_changes;
    for (size_t i = reversal_start; i < bars.size(); ++i) {
        recent_changes.push_back(bars[i].price_change_pct);
    }
    m.recent_price_change_pct = util::mean(recent_changes);

    // Book leaning against the recent move; confidence stays with the base call
    if (detects_reversals()) {
        if (m.recent_price_change_pct < -1.0 && m.volume_imbalance > 0.1) {
            result.direction = PressureDirection::PotentialReversalUp;
        } else if (m.recent_price_change_pct > 1.0 && m.volume_imbalance < -0.1) {
            result.direction = PressureDirection::PotentialReversalDown;
        }
    }

    spdlog::debug("Pressure [{}]: score={:.3f} direction={} confidence={:.2f}",
                  name(), m.pressure_score, to_string(result.direction), result.confidence);
    return result;
}

double CompositePressureAnalyzer::score(const PressureMetrics& m) const {
    return m.avg_inflow_ratio * 0.4 +
           m.volume_imbalance * 0.2 +
           m.value_imbalance * 0.2 +
           m.near_volume_imbalance * 0.2;
}

double FlowPressureAnalyzer::score(const PressureMetrics& m) const {
    return m.avg_inflow_ratio * 0.6 + m.volume_imbalance * 0.4;
}

std::unique_ptr<PressureAnalyzer> make_pressure_analyzer(PressureModel model) {
    switch (model) {
        case PressureModel::Composite:
            return std::make_unique<CompositePressureAnalyzer>();
        case PressureModel::Flow:
            return std::make_unique<FlowPressureAnalyzer>();
    }
    throw std::runtime_error("Unhandled pressure model");
}
