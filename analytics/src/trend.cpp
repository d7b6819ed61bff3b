#include "trend.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    std::string strength_reason(const TrendMetrics& m) {
        return fmt::format("price trend strength {:.2f}, inflow trend strength {:.2f}",
                           m.price_trend_strength, m.inflow_trend_strength);
    }

    double capped(double confidence) {
        return std::min(confidence, 0.95);
    }

    std::vector<StageRule> build_regression_rules() {
        return {
            {MarketStage::Top,
             [](const TrendMetrics& m) {
                 return m.price_trend > 0.7 && m.inflow_trend < 0.3 && m.correlation < -0.3;
             },
             [](const TrendMetrics& m) {
                 return capped(0.7 + m.price_trend - m.inflow_trend - m.correlation);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     "price keeps rising while inflow shrinks",
                     fmt::format("price and inflow negatively correlated ({:.2f})", m.correlation),
                     strength_reason(m)};
             }},
            {MarketStage::Bottom,
             [](const TrendMetrics& m) {
                 return m.price_trend < 0.3 && m.inflow_trend > 0.7 && m.correlation < -0.3;
             },
             [](const TrendMetrics& m) {
                 return capped(0.7 - m.price_trend + m.inflow_trend - m.correlation);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     "price keeps falling while inflow grows",
                     fmt::format("price and inflow negatively correlated ({:.2f})", m.correlation),
                     strength_reason(m)};
             }},
            {MarketStage::Uptrend,
             [](const TrendMetrics& m) {
                 return m.price_trend > 0.6 && m.inflow_trend > 0.6 && m.correlation > 0.3;
             },
             [](const TrendMetrics& m) {
                 return capped(m.price_trend + m.inflow_trend + m.correlation - 1.0);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     "price and inflow rising together",
                     fmt::format("price and inflow positively correlated ({:.2f})", m.correlation),
                     strength_reason(m)};
             }},
            {MarketStage::Downtrend,
             [](const TrendMetrics& m) {
                 return m.price_trend < 0.4 && m.inflow_trend < 0.4 && m.correlation > 0.3;
             },
             [](const TrendMetrics& m) {
                 return capped(1.0 - m.price_trend - m.inflow_trend + m.correlation);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     "price and inflow falling together",
                     fmt::format("price and inflow positively correlated ({:.2f})", m.correlation),
                     strength_reason(m)};
             }},
            {MarketStage::Consolidation,
             [](const TrendMetrics& m) {
                 return std::abs(m.price_trend - 0.5) < 0.15 && m.price_volatility < 0.01;
             },
             [](const TrendMetrics& m) {
                 return 0.5 + (0.15 - std::abs(m.price_trend - 0.5)) * 3.0;
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     "low price volatility",
                     "no clear direction",
                     fmt::format("price volatility {:.4f}", m.price_volatility)};
             }},

            // Fallback on raw step fractions
            {MarketStage::Uptrend,
             [](const TrendMetrics& m) { return m.price_trend > 0.5 && m.inflow_trend > 0.5; },
             [](const TrendMetrics& m) { return (m.price_trend + m.inflow_trend) / 2.0; },
             [](const TrendMetrics&) {
                 return std::vector<std::string>{"price and inflow both trending up"};
             }},
            {MarketStage::WeakeningUptrend,
             [](const TrendMetrics& m) { return m.price_trend > 0.5; },
             [](const TrendMetrics& m) { return m.price_trend * (1.0 - m.inflow_trend); },
             [](const TrendMetrics&) {
                 return std::vector<std::string>{"price rising but inflow weakening"};
             }},
            {MarketStage::Downtrend,
             [](const TrendMetrics& m) { return m.inflow_trend < 0.5; },
             [](const TrendMetrics& m) { return (1.0 - m.price_trend + 1.0 - m.inflow_trend) / 2.0; },
             [](const TrendMetrics&) {
                 return std::vector<std::string>{"price and inflow both trending down"};
             }},
            {MarketStage::WeakeningDowntrend,
             [](const TrendMetrics&) { return true; },
             [](const TrendMetrics& m) { return (1.0 - m.price_trend) * m.inflow_trend; },
             [](const TrendMetrics&) {
                 return std::vector<std::string>{"price falling but inflow strengthening"};
             }},
        };
    }

    std::vector<StageRule> build_windowed_rules() {
        return {
            {MarketStage::Top,
             [](const TrendMetrics& m) {
                 return m.window_price_change_pct > 2.0 && m.recent_inflow_share < -0.2;
             },
             [](const TrendMetrics& m) {
                 return std::min(0.5 + std::abs(m.recent_inflow_share) * 0.5, 0.9);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     fmt::format("price up {:.2f}% over the window", m.window_price_change_pct),
                     "recent bars are net outflow"};
             }},
            {MarketStage::Bottom,
             [](const TrendMetrics& m) {
                 return m.window_price_change_pct < -2.0 && m.recent_inflow_share > 0.2;
             },
             [](const TrendMetrics& m) {
                 return std::min(0.5 + std::abs(m.recent_inflow_share) * 0.5, 0.9);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     fmt::format("price down {:.2f}% over the window", -m.window_price_change_pct),
                     "recent bars are net inflow"};
             }},
            {MarketStage::Uptrend,
             [](const TrendMetrics& m) { return m.window_price_change_pct > 2.0; },
             [](const TrendMetrics& m) {
                 return std::min(0.4 + std::abs(m.window_price_change_pct) / 10.0, 0.9);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     fmt::format("price up {:.2f}% over the window", m.window_price_change_pct)};
             }},
            {MarketStage::Downtrend,
             [](const TrendMetrics& m) { return m.window_price_change_pct < -2.0; },
             [](const TrendMetrics& m) {
                 return std::min(0.4 + std::abs(m.window_price_change_pct) / 10.0, 0.9);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     fmt::format("price down {:.2f}% over the window", -m.window_price_change_pct)};
             }},
            {MarketStage::Consolidation,
             [](const TrendMetrics&) { return true; },
             [](const TrendMetrics& m) {
                 return std::max(0.3, 0.8 - std::abs(m.window_price_change_pct) / 5.0);
             },
             [](const TrendMetrics& m) {
                 return std::vector<std::string>{
                     fmt::format("price moved {:.2f}% over the window", m.window_price_change_pct)};
             }},
        };
    }
}

StageDecision evaluate_stage_rules(const std::vector<StageRule>& rules, const TrendMetrics& metrics) {
    StageDecision decision;
    for (const auto& rule : rules) {
        if (rule.matches(metrics)) {
            decision.stage = rule.stage;
            decision.confidence = rule.confidence(metrics);
            decision.reasons = rule.reasons(metrics);
            return decision;
        }
    }
    return decision;
}

TrendMetrics compute_trend_metrics(const std::vector<Bar>& bars) {
    TrendMetrics m;

    std::vector<double> prices;
    std::vector<double> inflows;
    std::vector<double> volumes;
    std::vector<double> index;
    prices.reserve(bars.size());
    inflows.reserve(bars.size());
    volumes.reserve(bars.size());
    index.reserve(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        prices.push_back(bars[i].close);
        inflows.push_back(bars[i].net_inflow);
        volumes.push_back(bars[i].quote_volume);
        index.push_back(static_cast<double>(i));
    }

    m.price_trend = util::rising_fraction(prices);
    m.inflow_trend = util::rising_fraction(inflows);
    m.volume_trend = util::rising_fraction(volumes);

    m.correlation = util::correlation(prices, inflows);
    m.inflow_volume_correlation = util::correlation(inflows, volumes);

    double mean_price = util::mean(prices);
    m.price_volatility = std::abs(mean_price) > 0.0
        ? util::std_dev(util::deltas(prices)) / mean_price
        : 0.0;

    m.price_regression = util::linear_regression(index, prices);
    m.price_trend_strength = std::abs(m.price_regression.r_value);
    m.price_trend_direction = m.price_regression.slope > 0.0 ? TrendDirection::Up : TrendDirection::Down;

    m.inflow_regression = util::linear_regression(index, inflows);
    m.inflow_trend_strength = std::abs(m.inflow_regression.r_value);
    m.inflow_trend_direction = m.inflow_regression.slope > 0.0 ? TrendDirection::Up : TrendDirection::Down;

    auto recent = util::tail(inflows, TrendClassifier::kRecentWindow);
    m.recent_inflow_trend = util::rising_fraction(recent);

    double first_close = prices.empty() ? 0.0 : prices.front();
    m.window_price_change_pct = first_close > 0.0
        ? (prices.back() - first_close) / first_close * 100.0
        : 0.0;

    size_t half = inflows.size() / 2;
    for (size_t i = 0; i < inflows.size(); ++i) {
        (i < half ? m.first_half_inflow : m.second_half_inflow) += inflows[i];
    }

    double recent_sum = 0.0;
    double recent_abs = 0.0;
    for (double v : recent) {
        recent_sum += v;
        recent_abs += std::abs(v);
    }
    m.recent_inflow_share = recent_abs > 0.0 ? recent_sum / recent_abs : 0.0;

    return m;
}

TrendResult TrendClassifier::classify(const std::vector<Bar>& bars) const {
    TrendResult result;
    if (bars.size() < kMinBars) {
        result.trend = FlowTrend::Unknown;
        result.confidence = 0.0;
        result.stage = MarketStage::InsufficientData;
        result.reasons.push_back(fmt::format("{} bars available, {} required", bars.size(), kMinBars));
        spdlog::warn("Trend classification skipped: {} bars, need {}", bars.size(), kMinBars);
        return result;
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        result.net_inflow_total += bars[i].net_inflow;
        if (i + kRecentWindow >= bars.size()) {
            result.net_inflow_recent += bars[i].net_inflow;
        }
    }

    result.metrics = compute_trend_metrics(bars);

    StageDecision decision = evaluate_stage_rules(stage_rules(), result.metrics);
    result.stage = decision.stage;
    result.confidence = decision.confidence;
    result.reasons = std::move(decision.reasons);
    result.trend = flow_trend(result.metrics);

    spdlog::debug("Trend [{}]: stage={} trend={} confidence={:.2f}",
                  name(), to_string(result.stage), to_string(result.trend), result.confidence);
    return result;
}

const std::vector<StageRule>& RegressionTrendClassifier::stage_rules() const {
    static const std::vector<StageRule> rules = build_regression_rules();
    return rules;
}

FlowTrend RegressionTrendClassifier::flow_trend(const TrendMetrics& m) const {
    if (m.inflow_trend_direction == TrendDirection::Up) {
        if (m.inflow_trend_strength > 0.5) return FlowTrend::Increasing;
        if (m.inflow_trend_strength > 0.3) return FlowTrend::SlightlyIncreasing;
    } else {
        if (m.inflow_trend_strength > 0.5) return FlowTrend::Decreasing;
        if (m.inflow_trend_strength > 0.3) return FlowTrend::SlightlyDecreasing;
    }
    return FlowTrend::Neutral;
}

const std::vector<StageRule>& WindowedTrendClassifier::stage_rules() const {
    static const std::vector<StageRule> rules = build_windowed_rules();
    return rules;
}

FlowTrend WindowedTrendClassifier::flow_trend(const TrendMetrics& m) const {
    if (m.recent_inflow_share > 0.0) {
        return m.second_half_inflow > m.first_half_inflow ? FlowTrend::Increasing
                                                          : FlowTrend::SlightlyIncreasing;
    }
    if (m.recent_inflow_share < 0.0) {
        return m.second_half_inflow < m.first_half_inflow ? FlowTrend::Decreasing
                                                          : FlowTrend::SlightlyDecreasing;
    }
    return FlowTrend::Neutral;
}

std::unique_ptr<TrendClassifier> make_trend_classifier(TrendModel model) {
    switch (model) {
        case TrendModel::Regression:
            return std::make_unique<RegressionTrendClassifier>();
        case TrendModel::Windowed:
            return std::make_unique<WindowedTrendClassifier>();
    }
    throw std::runtime_error("Unhandled trend model");
}
