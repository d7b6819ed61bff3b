#include "comparison.hpp"

namespace {
    double total_volume(const std::vector<Bar>& bars) {
        double sum = 0.0;
        for (const auto& bar : bars) {
            sum += bar.volume;
        }
        return sum;
    }
}

ComparisonResult compare_markets(const std::vector<Bar>& spot_bars,
                                 const std::vector<Bar>& futures_bars,
                                 const TrendResult& spot_trend,
                                 const TrendResult& futures_trend) {
    ComparisonResult result;

    if (!spot_bars.empty() && !futures_bars.empty()) {
        double spot_close = spot_bars.back().close;
        double futures_close = futures_bars.back().close;
        result.price_diff_pct = (spot_close - futures_close) / spot_close * 100.0;
    }

    double futures_volume = total_volume(futures_bars);
    result.volume_ratio = total_volume(spot_bars) / (futures_volume == 0.0 ? 1.0 : futures_volume);

    result.net_inflow_diff = spot_trend.net_inflow_total - futures_trend.net_inflow_total;
    return result;
}
