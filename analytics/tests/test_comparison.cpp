#include "comparison.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using testing_helpers::make_bar;

namespace {

std::vector<Bar> bars_with_volume(double close, double volume_each, size_t count) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < count; ++i) {
        bars.push_back(make_bar(i, close, close, volume_each));
    }
    return bars;
}

} // namespace

TEST(ComparisonTest, VolumeRatioAndPriceDiff) {
    auto spot = bars_with_volume(101.0, 100.0, 10);
    auto futures = bars_with_volume(100.0, 50.0, 10);

    TrendResult spot_trend;
    spot_trend.net_inflow_total = 5000.0;
    TrendResult futures_trend;
    futures_trend.net_inflow_total = 1500.0;

    ComparisonResult result = compare_markets(spot, futures, spot_trend, futures_trend);
    EXPECT_DOUBLE_EQ(result.volume_ratio, 2.0);
    EXPECT_NEAR(result.price_diff_pct, 0.990099, 1e-6);
    EXPECT_DOUBLE_EQ(result.net_inflow_diff, 3500.0);
}

TEST(ComparisonTest, ZeroFuturesVolumeDividesByOne) {
    auto spot = bars_with_volume(100.0, 25.0, 4);
    auto futures = bars_with_volume(100.0, 0.0, 4);

    ComparisonResult result = compare_markets(spot, futures, TrendResult{}, TrendResult{});
    EXPECT_DOUBLE_EQ(result.volume_ratio, 100.0);
    EXPECT_DOUBLE_EQ(result.price_diff_pct, 0.0);
}

TEST(ComparisonTest, MissingSideLeavesPriceDiffAtZero) {
    auto spot = bars_with_volume(100.0, 10.0, 3);

    ComparisonResult result = compare_markets(spot, {}, TrendResult{}, TrendResult{});
    EXPECT_DOUBLE_EQ(result.price_diff_pct, 0.0);
    EXPECT_DOUBLE_EQ(result.volume_ratio, 30.0);
}
