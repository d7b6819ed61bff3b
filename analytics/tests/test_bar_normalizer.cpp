#include "bar_normalizer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <limits>

using testing_helpers::make_raw;

class BarNormalizerTest : public ::testing::Test {
protected:
    BarNormalizer normalizer_;
};

TEST_F(BarNormalizerTest, DropsTheFormingBar) {
    std::vector<RawBar> raw{
        make_raw(0, 100.0, 101.0, 10.0, 1005.0),
        make_raw(1, 101.0, 100.0, 20.0, 2010.0),
        make_raw(2, 100.0, 102.0, 5.0, 505.0),
    };

    auto bars = normalizer_.normalize(raw);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].open_time, raw[0].open_time);
    EXPECT_EQ(bars[1].open_time, raw[1].open_time);
    EXPECT_DOUBLE_EQ(bars[1].quote_volume, 2010.0);
}

TEST_F(BarNormalizerTest, SingleRowLeavesNoClosedBars) {
    auto bars = normalizer_.normalize({make_raw(0, 100.0, 101.0, 10.0, 1005.0)});
    EXPECT_TRUE(bars.empty());
}

TEST_F(BarNormalizerTest, BullishBarLeansToBuyers) {
    Bar bar = BarNormalizer::enrich(make_raw(0, 100.0, 102.0, 10.0, 1010.0));
    EXPECT_DOUBLE_EQ(bar.buy_volume, 6.0);
    EXPECT_DOUBLE_EQ(bar.sell_volume, 4.0);
    EXPECT_EQ(bar.buy_volume + bar.sell_volume, bar.volume);
    EXPECT_DOUBLE_EQ(bar.net_inflow, 2.0 * 102.0);
    EXPECT_DOUBLE_EQ(bar.price_change_pct, 2.0);
}

TEST_F(BarNormalizerTest, BearishBarLeansToSellers) {
    Bar bar = BarNormalizer::enrich(make_raw(0, 100.0, 95.0, 7.3, 700.0));
    EXPECT_DOUBLE_EQ(bar.sell_volume, 7.3 * 0.6);
    EXPECT_EQ(bar.buy_volume + bar.sell_volume, bar.volume);
    EXPECT_LT(bar.net_inflow, 0.0);
    EXPECT_DOUBLE_EQ(bar.price_change_pct, -5.0);
}

TEST_F(BarNormalizerTest, UnchangedCloseCountsAsBullish) {
    Bar bar = BarNormalizer::enrich(make_raw(0, 100.0, 100.0, 10.0, 1000.0));
    EXPECT_DOUBLE_EQ(bar.buy_volume, 6.0);
    EXPECT_DOUBLE_EQ(bar.price_change_pct, 0.0);
}

TEST_F(BarNormalizerTest, RejectsEmptyInput) {
    EXPECT_THROW(normalizer_.normalize({}), InvalidInput);
}

TEST_F(BarNormalizerTest, RejectsNonPositivePrice) {
    std::vector<RawBar> raw{make_raw(0, 100.0, 101.0, 1.0, 100.0), make_raw(1, 0.0, 101.0, 1.0, 100.0)};
    EXPECT_THROW(normalizer_.normalize(raw), InvalidInput);
}

TEST_F(BarNormalizerTest, RejectsNegativeVolume) {
    std::vector<RawBar> raw{make_raw(0, 100.0, 101.0, -1.0, 100.0), make_raw(1, 100.0, 101.0, 1.0, 100.0)};
    EXPECT_THROW(normalizer_.normalize(raw), InvalidInput);
}

TEST_F(BarNormalizerTest, RejectsBarClosingBeforeItOpens) {
    RawBar bad = make_raw(0, 100.0, 101.0, 1.0, 100.0);
    bad.close_time = bad.open_time;
    EXPECT_THROW(normalizer_.normalize({bad, make_raw(1, 100.0, 101.0, 1.0, 100.0)}), InvalidInput);
}

TEST_F(BarNormalizerTest, RejectsOutOfOrderBars) {
    std::vector<RawBar> raw{make_raw(1, 100.0, 101.0, 1.0, 100.0), make_raw(0, 100.0, 101.0, 1.0, 100.0)};
    EXPECT_THROW(normalizer_.normalize(raw), InvalidInput);
}

TEST_F(BarNormalizerTest, RejectsNonFiniteFields) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    RawBar next = make_raw(1, 100.0, 101.0, 1.0, 100.0);

    RawBar bad_close = make_raw(0, 100.0, 101.0, 1.0, 100.0);
    bad_close.close = nan;
    EXPECT_THROW(normalizer_.normalize({bad_close, next}), InvalidInput);

    RawBar bad_high = make_raw(0, 100.0, 101.0, 1.0, 100.0);
    bad_high.high = inf;
    EXPECT_THROW(normalizer_.normalize({bad_high, next}), InvalidInput);

    RawBar bad_volume = make_raw(0, 100.0, 101.0, 1.0, 100.0);
    bad_volume.volume = nan;
    EXPECT_THROW(normalizer_.normalize({bad_volume, next}), InvalidInput);

    RawBar bad_quote = make_raw(0, 100.0, 101.0, 1.0, 100.0);
    bad_quote.quote_volume = inf;
    EXPECT_THROW(normalizer_.normalize({bad_quote, next}), InvalidInput);
}
