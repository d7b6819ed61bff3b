#pragma once

#include "types.hpp"
#include "config.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// One row of a stage table. Rows are tried in order and the first match wins,
// so a table must end with a row whose predicate always holds.
struct StageRule {
    MarketStage stage;
    std::function<bool(const TrendMetrics&)> matches;
    std::function<double(const TrendMetrics&)> confidence;
    std::function<std::vector<std::string>(const TrendMetrics&)> reasons;
};

struct StageDecision {
    MarketStage stage = MarketStage::InsufficientData;
    double confidence = 0.0;
    std::vector<std::string> reasons;
};

StageDecision evaluate_stage_rules(const std::vector<StageRule>& rules, const TrendMetrics& metrics);

// Every metric both trend models read. Expects at least two bars.
TrendMetrics compute_trend_metrics(const std::vector<Bar>& bars);

class TrendClassifier {
public:
    static constexpr size_t kMinBars = 10;
    static constexpr size_t kRecentWindow = 10;

    virtual ~TrendClassifier() = default;

    // Fewer than kMinBars bars yields the Unknown / InsufficientData sentinel
    TrendResult classify(const std::vector<Bar>& bars) const;

    virtual std::string name() const = 0;

protected:
    virtual const std::vector<StageRule>& stage_rules() const = 0;
    virtual FlowTrend flow_trend(const TrendMetrics& metrics) const = 0;
};

// Regression / correlation model
class RegressionTrendClassifier : public TrendClassifier {
public:
    std::string name() const override { return "regression"; }

protected:
    const std::vector<StageRule>& stage_rules() const override;
    FlowTrend flow_trend(const TrendMetrics& metrics) const override;
};

// Simpler model comparing window price change with where recent flow went
class WindowedTrendClassifier : public TrendClassifier {
public:
    std::string name() const override { return "windowed"; }

protected:
    const std::vector<StageRule>& stage_rules() const override;
    FlowTrend flow_trend(const TrendMetrics& metrics) const override;
};

std::unique_ptr<TrendClassifier> make_trend_classifier(TrendModel model);
