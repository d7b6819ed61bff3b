#include "types.hpp"
#include "util.hpp"
#include <cmath>

using json = nlohmann::json;

namespace {
    // JSON has no infinity literal; an unbounded ratio is written as a string
    json ratio_to_json(double value) {
        if (std::isinf(value)) {
            return value > 0 ? "Infinity" : "-Infinity";
        }
        return value;
    }

    json deviation_to_json(const Deviation& d) {
        return {
            {"value", d.value},
            {"z_score", d.z_score},
            {"direction", to_string(d.direction)}
        };
    }

    json optional_time(const std::optional<int64_t>& t) {
        if (!t) {
            return nullptr;
        }
        return util::format_timestamp_ms(*t);
    }
}

std::string to_string(MarketKind kind) {
    switch (kind) {
        case MarketKind::Spot: return "spot";
        case MarketKind::Futures: return "futures";
    }
    return "unknown";
}

std::string to_string(Interval interval) {
    switch (interval) {
        case Interval::M5: return "5m";
        case Interval::M15: return "15m";
        case Interval::M30: return "30m";
        case Interval::H1: return "1h";
        case Interval::H4: return "4h";
        case Interval::D1: return "1d";
    }
    return "unknown";
}

std::string to_string(TrendDirection direction) {
    return direction == TrendDirection::Up ? "up" : "down";
}

std::string to_string(FlowTrend trend) {
    switch (trend) {
        case FlowTrend::Increasing: return "increasing";
        case FlowTrend::SlightlyIncreasing: return "slightly_increasing";
        case FlowTrend::Neutral: return "neutral";
        case FlowTrend::SlightlyDecreasing: return "slightly_decreasing";
        case FlowTrend::Decreasing: return "decreasing";
        case FlowTrend::Unknown: return "unknown";
    }
    return "unknown";
}

std::string to_string(MarketStage stage) {
    switch (stage) {
        case MarketStage::Top: return "top";
        case MarketStage::Bottom: return "bottom";
        case MarketStage::Uptrend: return "uptrend";
        case MarketStage::Downtrend: return "downtrend";
        case MarketStage::Consolidation: return "consolidation";
        case MarketStage::WeakeningUptrend: return "weakening_uptrend";
        case MarketStage::WeakeningDowntrend: return "weakening_downtrend";
        case MarketStage::InsufficientData: return "insufficient_data";
    }
    return "unknown";
}

std::string to_string(Severity severity) {
    return severity == Severity::High ? "high" : "low";
}

std::string to_string(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::HighVolumeLowPriceChange: return "high_volume_low_price_change";
        case AnomalyKind::HighPriceChangeLowVolume: return "high_price_change_low_volume";
        case AnomalyKind::ExtremeNetInflow: return "extreme_net_inflow";
        case AnomalyKind::ExtremeNetOutflow: return "extreme_net_outflow";
        case AnomalyKind::VolumeSpike: return "volume_spike";
        case AnomalyKind::NetInflowSpike: return "net_inflow_spike";
        case AnomalyKind::PriceVolumeMismatch: return "price_volume_mismatch";
    }
    return "unknown";
}

std::string to_string(PressureDirection direction) {
    switch (direction) {
        case PressureDirection::UpwardStrong: return "upward_strong";
        case PressureDirection::Upward: return "upward";
        case PressureDirection::Neutral: return "neutral";
        case PressureDirection::Downward: return "downward";
        case PressureDirection::DownwardStrong: return "downward_strong";
        case PressureDirection::PotentialReversalUp: return "potential_reversal_up";
        case PressureDirection::PotentialReversalDown: return "potential_reversal_down";
        case PressureDirection::Unknown: return "unknown";
    }
    return "unknown";
}

Interval parse_interval(const std::string& label) {
    if (label == "5m") return Interval::M5;
    if (label == "15m") return Interval::M15;
    if (label == "30m") return Interval::M30;
    if (label == "1h") return Interval::H1;
    if (label == "4h") return Interval::H4;
    if (label == "1d") return Interval::D1;
    throw InvalidInput("Unsupported interval: " + label);
}

json Bar::to_json() const {
    return {
        {"open_time", util::format_timestamp_ms(open_time)},
        {"close_time", util::format_timestamp_ms(close_time)},
        {"open", open},
        {"high", high},
        {"low", low},
        {"close", close},
        {"volume", volume},
        {"quote_volume", quote_volume},
        {"buy_volume", buy_volume},
        {"sell_volume", sell_volume},
        {"net_inflow", net_inflow},
        {"price_change_pct", price_change_pct}
    };
}

json OrderBookStats::to_json() const {
    json j;
    j["total_bid_qty"] = total_bid_qty;
    j["total_ask_qty"] = total_ask_qty;
    j["imbalance"] = imbalance;
    j["bid_pressure"] = bid_pressure;
    j["ask_pressure"] = ask_pressure;
    j["pressure_ratio"] = ratio_to_json(pressure_ratio);
    j["price_range"]["best_bid"] = best_bid;
    j["price_range"]["best_ask"] = best_ask;
    j["price_range"]["spread"] = spread;
    j["price_range"]["spread_pct"] = spread_pct;
    return j;
}

json TrendMetrics::to_json() const {
    return {
        {"price_trend", price_trend},
        {"price_trend_direction", to_string(price_trend_direction)},
        {"price_trend_strength", price_trend_strength},
        {"price_slope", price_regression.slope},
        {"price_intercept", price_regression.intercept},
        {"inflow_trend", inflow_trend},
        {"inflow_trend_direction", to_string(inflow_trend_direction)},
        {"inflow_trend_strength", inflow_trend_strength},
        {"inflow_slope", inflow_regression.slope},
        {"inflow_intercept", inflow_regression.intercept},
        {"volume_trend", volume_trend},
        {"correlation", correlation},
        {"inflow_volume_correlation", inflow_volume_correlation},
        {"price_volatility", price_volatility},
        {"recent_inflow_trend", recent_inflow_trend},
        {"window_price_change_pct", window_price_change_pct},
        {"first_half_inflow", first_half_inflow},
        {"second_half_inflow", second_half_inflow},
        {"recent_inflow_share", recent_inflow_share}
    };
}

json TrendResult::to_json() const {
    return {
        {"trend", to_string(trend)},
        {"confidence", confidence},
        {"net_inflow_total", net_inflow_total},
        {"net_inflow_recent", net_inflow_recent},
        {"stage", to_string(stage)},
        {"reasons", reasons},
        {"metrics", metrics.to_json()}
    };
}

json AnomalyRecord::to_json() const {
    json j;
    j["time"] = util::format_timestamp_ms(time);

    json types = json::array();
    for (const auto& kind : kinds) {
        types.push_back(to_string(kind));
    }
    j["types"] = types;

    if (volume) {
        j["volume"] = deviation_to_json(*volume);
    }
    if (net_inflow) {
        j["net_inflow"] = deviation_to_json(*net_inflow);
    }
    if (mismatch) {
        j["price_volume_mismatch"] = {
            {"price_change", mismatch->price_change},
            {"volume_z_score", mismatch->volume_z_score}
        };
    }
    if (flow_ratio) {
        j["flow_ratio"] = *flow_ratio;
    }
    return j;
}

json AnomalyReport::to_json() const {
    json list = json::array();
    for (const auto& record : anomalies) {
        list.push_back(record.to_json());
    }
    return {
        {"has_anomalies", has_anomalies},
        {"anomalies", list}
    };
}

json PressureResult::to_json() const {
    return {
        {"direction", to_string(direction)},
        {"confidence", confidence},
        {"imbalance", imbalance},
        {"bid_ask_ratio", ratio_to_json(bid_ask_ratio)},
        {"metrics", {
            {"avg_inflow_ratio", metrics.avg_inflow_ratio},
            {"volume_imbalance", metrics.volume_imbalance},
            {"value_imbalance", metrics.value_imbalance},
            {"near_volume_imbalance", metrics.near_volume_imbalance},
            {"pressure_score", metrics.pressure_score},
            {"recent_price_change_pct", metrics.recent_price_change_pct}
        }}
    };
}

json ComparisonResult::to_json() const {
    return {
        {"spot_vs_futures_price_diff", price_diff_pct},
        {"spot_vs_futures_volume_ratio", volume_ratio},
        {"spot_vs_futures_net_inflow_diff", net_inflow_diff}
    };
}

json BarSummary::to_json() const {
    return {
        {"first_time", optional_time(first_time)},
        {"last_time", optional_time(last_time)},
        {"price_change", price_change_pct},
        {"current_price", current_price},
        {"total_volume", total_volume},
        {"total_quote_volume", total_quote_volume}
    };
}

json MarketAnalysis::to_json() const {
    return {
        {"klines_summary", summary.to_json()},
        {"funding_trend", trend.to_json()},
        {"anomalies", anomalies.to_json()},
        {"order_book", order_book.to_json()},
        {"funding_pressure", pressure.to_json()}
    };
}

json SymbolAnalysis::to_json() const {
    return {
        {"spot", spot.to_json()},
        {"futures", futures.to_json()},
        {"comparison", comparison.to_json()}
    };
}

json AnalysisMetadata::to_json() const {
    return {
        {"analysis_time", analysis_time},
        {"symbols_analyzed", symbols_analyzed},
        {"interval", to_string(interval)},
        {"data_source_name", data_source_name},
        {"klines_count", klines_count}
    };
}

json AnalysisReport::to_json() const {
    json j;
    j["metadata"] = metadata.to_json();
    j["analysis"] = json::object();
    for (const auto& [symbol, result] : analysis) {
        j["analysis"][symbol] = result.to_json();
    }
    return j;
}
