#pragma once

#include "types.hpp"
#include "config.hpp"
#include "bar_normalizer.hpp"
#include "depth_aggregator.hpp"
#include "trend.hpp"
#include "anomaly.hpp"
#include "pressure.hpp"
#include <memory>
#include <string>
#include <vector>

class MarketAnalyzer {
public:
    explicit MarketAnalyzer(const Config& config);

    // Runs every symbol of the request and stamps the run metadata.
    // Throws InvalidInput naming the symbol and market that failed.
    AnalysisReport analyze(const AnalysisRequest& request) const;

    SymbolAnalysis analyze_symbol(const SymbolSnapshot& snapshot) const;

    static BarSummary summarize(const std::vector<Bar>& bars);

private:
    struct MarketRun {
        std::vector<Bar> bars;
        MarketAnalysis analysis;
    };

    MarketRun run_market(const std::string& symbol, MarketKind kind, const MarketSnapshot& snapshot) const;

    const Config& config_;
    BarNormalizer normalizer_;
    DepthAggregator depth_aggregator_;
    std::unique_ptr<TrendClassifier> trend_classifier_;
    std::unique_ptr<AnomalyDetector> anomaly_detector_;
    std::unique_ptr<PressureAnalyzer> pressure_analyzer_;
};
