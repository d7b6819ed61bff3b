#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Raised for malformed or empty raw market data. No partial result is produced.
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

enum class MarketKind {
    Spot,
    Futures
};

enum class Interval {
    M5,
    M15,
    M30,
    H1,
    H4,
    D1
};

// Raw candle as delivered by the exchange, before enrichment
struct RawBar {
    int64_t open_time = 0;   // ms since epoch
    int64_t close_time = 0;  // ms since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double quote_volume = 0.0;
};

struct Bar {
    int64_t open_time = 0;
    int64_t close_time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double quote_volume = 0.0;
    double buy_volume = 0.0;
    double sell_volume = 0.0;
    double net_inflow = 0.0;
    double price_change_pct = 0.0;

    nlohmann::json to_json() const;
};

struct DepthLevel {
    double price = 0.0;
    double quantity = 0.0;
};

struct OrderBookStats {
    double total_bid_qty = 0.0;
    double total_ask_qty = 0.0;
    double imbalance = 0.0;
    double bid_pressure = 0.0;
    double ask_pressure = 0.0;
    double pressure_ratio = 0.0;  // +inf when ask pressure is 0
    double best_bid = 0.0;
    double best_ask = 0.0;
    double spread = 0.0;
    double spread_pct = 0.0;

    nlohmann::json to_json() const;
};

enum class TrendDirection {
    Up,
    Down
};

enum class FlowTrend {
    Increasing,
    SlightlyIncreasing,
    Neutral,
    SlightlyDecreasing,
    Decreasing,
    Unknown
};

enum class MarketStage {
    Top,
    Bottom,
    Uptrend,
    Downtrend,
    Consolidation,
    WeakeningUptrend,
    WeakeningDowntrend,
    InsufficientData
};

struct RegressionResult {
    double slope = 0.0;
    double intercept = 0.0;
    double r_value = 0.0;
};

struct TrendMetrics {
    double price_trend = 0.0;
    double inflow_trend = 0.0;
    double volume_trend = 0.0;
    double correlation = 0.0;
    double inflow_volume_correlation = 0.0;
    double price_volatility = 0.0;
    RegressionResult price_regression;
    RegressionResult inflow_regression;
    double price_trend_strength = 0.0;
    TrendDirection price_trend_direction = TrendDirection::Down;
    double inflow_trend_strength = 0.0;
    TrendDirection inflow_trend_direction = TrendDirection::Down;
    double recent_inflow_trend = 0.0;

    // Windowed model inputs
    double window_price_change_pct = 0.0;
    double first_half_inflow = 0.0;
    double second_half_inflow = 0.0;
    double recent_inflow_share = 0.0;

    nlohmann::json to_json() const;
};

struct TrendResult {
    FlowTrend trend = FlowTrend::Unknown;
    double confidence = 0.0;
    double net_inflow_total = 0.0;
    double net_inflow_recent = 0.0;
    MarketStage stage = MarketStage::InsufficientData;
    std::vector<std::string> reasons;
    TrendMetrics metrics;

    nlohmann::json to_json() const;
};

enum class Severity {
    High,
    Low
};

enum class AnomalyKind {
    HighVolumeLowPriceChange,
    HighPriceChangeLowVolume,
    ExtremeNetInflow,
    ExtremeNetOutflow,
    VolumeSpike,
    NetInflowSpike,
    PriceVolumeMismatch
};

struct Deviation {
    double value = 0.0;
    double z_score = 0.0;
    Severity direction = Severity::High;
};

struct PriceVolumeMismatch {
    double price_change = 0.0;  // percent
    double volume_z_score = 0.0;
};

struct AnomalyRecord {
    int64_t time = 0;  // bar open time, ms
    std::vector<AnomalyKind> kinds;
    std::optional<Deviation> volume;
    std::optional<Deviation> net_inflow;
    std::optional<PriceVolumeMismatch> mismatch;
    std::optional<double> flow_ratio;  // |net inflow| / quote volume

    nlohmann::json to_json() const;
};

struct AnomalyReport {
    bool has_anomalies = false;
    std::vector<AnomalyRecord> anomalies;

    nlohmann::json to_json() const;
};

enum class PressureDirection {
    UpwardStrong,
    Upward,
    Neutral,
    Downward,
    DownwardStrong,
    PotentialReversalUp,
    PotentialReversalDown,
    Unknown
};

struct PressureMetrics {
    double avg_inflow_ratio = 0.0;
    double volume_imbalance = 0.0;
    double value_imbalance = 0.0;
    // Same value as volume_imbalance: a near-touch imbalance is not computed yet
    double near_volume_imbalance = 0.0;
    double pressure_score = 0.0;
    double recent_price_change_pct = 0.0;
};

struct PressureResult {
    PressureDirection direction = PressureDirection::Unknown;
    double confidence = 0.0;
    double imbalance = 0.0;
    double bid_ask_ratio = 0.0;
    PressureMetrics metrics;

    nlohmann::json to_json() const;
};

struct ComparisonResult {
    double price_diff_pct = 0.0;
    double volume_ratio = 0.0;
    double net_inflow_diff = 0.0;

    nlohmann::json to_json() const;
};

struct BarSummary {
    std::optional<int64_t> first_time;
    std::optional<int64_t> last_time;
    double price_change_pct = 0.0;
    double current_price = 0.0;
    double total_volume = 0.0;
    double total_quote_volume = 0.0;

    nlohmann::json to_json() const;
};

struct MarketAnalysis {
    BarSummary summary;
    TrendResult trend;
    AnomalyReport anomalies;
    OrderBookStats order_book;
    PressureResult pressure;

    nlohmann::json to_json() const;
};

struct SymbolAnalysis {
    MarketAnalysis spot;
    MarketAnalysis futures;
    ComparisonResult comparison;

    nlohmann::json to_json() const;
};

struct AnalysisMetadata {
    std::string analysis_time;
    std::vector<std::string> symbols_analyzed;
    Interval interval = Interval::H1;
    std::string data_source_name;
    int klines_count = 0;

    nlohmann::json to_json() const;
};

struct AnalysisReport {
    AnalysisMetadata metadata;
    std::map<std::string, SymbolAnalysis> analysis;

    nlohmann::json to_json() const;
};

// Raw inputs for one (symbol, market) pair
struct MarketSnapshot {
    std::vector<RawBar> klines;
    std::vector<DepthLevel> bids;
    std::vector<DepthLevel> asks;
};

struct SymbolSnapshot {
    std::string symbol;
    MarketSnapshot spot;
    MarketSnapshot futures;
};

// One batch run: every symbol shares the interval and window size
struct AnalysisRequest {
    Interval interval = Interval::H1;
    int limit = 0;  // bars per market after the forming bar is dropped; 0 when not stated
    std::vector<SymbolSnapshot> symbols;
};

std::string to_string(MarketKind kind);
std::string to_string(Interval interval);
std::string to_string(TrendDirection direction);
std::string to_string(FlowTrend trend);
std::string to_string(MarketStage stage);
std::string to_string(Severity severity);
std::string to_string(AnomalyKind kind);
std::string to_string(PressureDirection direction);

// Throws InvalidInput for labels outside the supported set
Interval parse_interval(const std::string& label);
