#include "market_analyzer.hpp"
#include "comparison.hpp"
#include "util.hpp"
#include <future>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

MarketAnalyzer::MarketAnalyzer(const Config& config)
    : config_(config),
      depth_aggregator_(config.depth_limit),
      trend_classifier_(make_trend_classifier(config.trend_model)),
      anomaly_detector_(make_anomaly_detector(config.anomaly_mode)),
      pressure_analyzer_(make_pressure_analyzer(config.pressure_model)) {}

AnalysisReport MarketAnalyzer::analyze(const AnalysisRequest& request) const {
    AnalysisReport report;
    report.metadata.analysis_time = util::current_iso8601();
    report.metadata.interval = request.interval;
    report.metadata.data_source_name = config_.data_source_name;
    report.metadata.klines_count = request.limit > 0 ? request.limit : config_.klines_limit;

    for (const auto& snapshot : request.symbols) {
        report.metadata.symbols_analyzed.push_back(snapshot.symbol);
    }

    spdlog::info("Analyzing {} symbol(s) on {} bars", request.symbols.size(), to_string(request.interval));

    if (config_.parallel_symbols && request.symbols.size() > 1) {
        std::vector<std::future<SymbolAnalysis>> pending;
        pending.reserve(request.symbols.size());
        for (const auto& snapshot : request.symbols) {
            pending.push_back(std::async(std::launch::async, [this, &snapshot]() {
                return analyze_symbol(snapshot);
            }));
        }
        // get() rethrows the first failure in request order
        for (size_t i = 0; i < pending.size(); ++i) {
            report.analysis[request.symbols[i].symbol] = pending[i].get();
        }
    } else {
        for (const auto& snapshot : request.symbols) {
            report.analysis[snapshot.symbol] = analyze_symbol(snapshot);
        }
    }

    return report;
}

SymbolAnalysis MarketAnalyzer::analyze_symbol(const SymbolSnapshot& snapshot) const {
    MarketRun spot = run_market(snapshot.symbol, MarketKind::Spot, snapshot.spot);
    MarketRun futures = run_market(snapshot.symbol, MarketKind::Futures, snapshot.futures);

    SymbolAnalysis result;
    result.comparison = compare_markets(spot.bars, futures.bars, spot.analysis.trend, futures.analysis.trend);
    result.spot = std::move(spot.analysis);
    result.futures = std::move(futures.analysis);

    spdlog::info("{}: spot {} / futures {}, spot-futures price diff {:.3f}%",
                 snapshot.symbol,
                 to_string(result.spot.trend.stage),
                 to_string(result.futures.trend.stage),
                 result.comparison.price_diff_pct);
    return result;
}

BarSummary MarketAnalyzer::summarize(const std::vector<Bar>& bars) {
    BarSummary summary;
    if (bars.empty()) {
        return summary;
    }

    const Bar& first = bars.front();
    const Bar& last = bars.back();
    summary.first_time = first.open_time;
    summary.last_time = last.close_time;
    summary.price_change_pct = (last.close - first.open) / first.open * 100.0;
    summary.current_price = last.close;
    for (const auto& bar : bars) {
        summary.total_volume += bar.volume;
        summary.total_quote_volume += bar.quote_volume;
    }
    return summary;
}

MarketAnalyzer::MarketRun MarketAnalyzer::run_market(const std::string& symbol,
                                                     MarketKind kind,
                                                     const MarketSnapshot& snapshot) const {
    MarketRun run;
    try {
        run.bars = normalizer_.normalize(snapshot.klines);
        run.analysis.order_book = depth_aggregator_.aggregate(snapshot.bids, snapshot.asks);
    } catch (const InvalidInput& e) {
        throw InvalidInput(fmt::format("{} {}: {}", symbol, to_string(kind), e.what()));
    }

    run.analysis.summary = summarize(run.bars);
    run.analysis.trend = trend_classifier_->classify(run.bars);
    run.analysis.anomalies = anomaly_detector_->detect(run.bars);
    run.analysis.pressure = pressure_analyzer_->analyze(run.bars, run.analysis.order_book);

    spdlog::debug("{} {}: {} bars, imbalance {:.3f}, {} anomalies",
                  symbol, to_string(kind), run.bars.size(),
                  run.analysis.order_book.imbalance, run.analysis.anomalies.anomalies.size());
    return run;
}
