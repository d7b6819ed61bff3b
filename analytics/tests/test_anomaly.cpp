#include "anomaly.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using testing_helpers::flat_bars;
using testing_helpers::make_bar;

namespace {

const AnomalyRecord* find_kind(const AnomalyReport& report, AnomalyKind kind) {
    for (const auto& record : report.anomalies) {
        if (std::find(record.kinds.begin(), record.kinds.end(), kind) != record.kinds.end()) {
            return &record;
        }
    }
    return nullptr;
}

} // namespace

class RatioAnomalyTest : public ::testing::Test {
protected:
    RatioAnomalyDetector detector_;
};

TEST_F(RatioAnomalyTest, FewerThanFiveBarsReportsNothing) {
    // Would be an extreme inflow bar with enough history
    std::vector<Bar> bars = flat_bars(3, 100.0, 10.0);
    bars.push_back(make_bar(3, 100.0, 100.0, 10.0, 100.0));
    AnomalyReport report = detector_.detect(bars);
    EXPECT_FALSE(report.has_anomalies);
    EXPECT_TRUE(report.anomalies.empty());
}

TEST_F(RatioAnomalyTest, ConstantSeriesHasNoAnomalies) {
    AnomalyReport report = detector_.detect(flat_bars(20));
    EXPECT_FALSE(report.has_anomalies);
    EXPECT_TRUE(report.anomalies.empty());
}

TEST_F(RatioAnomalyTest, HeavyVolumeWithoutPriceMoveIsFlagged) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < 10; ++i) {
        if (i == 6) {
            bars.push_back(make_bar(i, 100.0, 100.0, 100.0, 10000.0));
        } else {
            bars.push_back(make_bar(i, 100.0, 100.1, 10.0, 1000.0));
        }
    }

    AnomalyReport report = detector_.detect(bars);
    ASSERT_TRUE(report.has_anomalies);
    ASSERT_EQ(report.anomalies.size(), 1u);

    const AnomalyRecord& record = report.anomalies.front();
    EXPECT_EQ(record.time, bars[6].open_time);
    ASSERT_EQ(record.kinds.size(), 1u);
    EXPECT_EQ(record.kinds.front(), AnomalyKind::HighVolumeLowPriceChange);
    ASSERT_TRUE(record.volume.has_value());
    EXPECT_DOUBLE_EQ(record.volume->value, 10000.0);
    EXPECT_NEAR(record.volume->z_score, 3.0, 1e-9);
    EXPECT_EQ(record.volume->direction, Severity::High);
}

TEST_F(RatioAnomalyTest, DominantNetInflowIsFlaggedWithRatio) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < 10; ++i) {
        bars.push_back(make_bar(i, 100.0, 100.0, 10.0, i == 4 ? 100.0 : 1000.0));
    }

    AnomalyReport report = detector_.detect(bars);
    ASSERT_EQ(report.anomalies.size(), 1u);

    const AnomalyRecord& record = report.anomalies.front();
    EXPECT_EQ(record.kinds, std::vector<AnomalyKind>{AnomalyKind::ExtremeNetInflow});
    ASSERT_TRUE(record.net_inflow.has_value());
    EXPECT_DOUBLE_EQ(record.net_inflow->z_score, 2.0);
    EXPECT_EQ(record.net_inflow->direction, Severity::High);
    ASSERT_TRUE(record.flow_ratio.has_value());
    EXPECT_NEAR(*record.flow_ratio, 2.0, 1e-9);
}

TEST_F(RatioAnomalyTest, DominantNetOutflowIsFlaggedWithRatio) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < 10; ++i) {
        if (i == 3) {
            bars.push_back(make_bar(i, 101.0, 100.0, 10.0, 100.0));
        } else {
            bars.push_back(make_bar(i, 100.0, 100.0, 10.0, 1000.0));
        }
    }

    AnomalyReport report = detector_.detect(bars);
    const AnomalyRecord* outflow = find_kind(report, AnomalyKind::ExtremeNetOutflow);
    ASSERT_NE(outflow, nullptr);
    EXPECT_EQ(outflow->time, bars[3].open_time);
    EXPECT_DOUBLE_EQ(outflow->net_inflow->z_score, -2.0);
    EXPECT_EQ(outflow->net_inflow->direction, Severity::Low);
    EXPECT_NEAR(*outflow->flow_ratio, 2.0, 1e-9);

    // The same bar moved 1% on a tenth of the usual volume
    const AnomalyRecord* thin = find_kind(report, AnomalyKind::HighPriceChangeLowVolume);
    ASSERT_NE(thin, nullptr);
    EXPECT_EQ(thin->time, bars[3].open_time);
    ASSERT_TRUE(thin->mismatch.has_value());
    EXPECT_NEAR(thin->mismatch->price_change, 100.0 / 101.0, 1e-9);
}

class ZScoreAnomalyTest : public ::testing::Test {
protected:
    ZScoreAnomalyDetector detector_;
};

TEST_F(ZScoreAnomalyTest, ConstantSeriesHasNoAnomalies) {
    AnomalyReport report = detector_.detect(flat_bars(20));
    EXPECT_FALSE(report.has_anomalies);
}

TEST_F(ZScoreAnomalyTest, VolumeSpikeCarriesBothDeviations) {
    std::vector<Bar> bars = flat_bars(10);
    bars[7] = make_bar(7, 100.0, 100.0, 100.0);

    AnomalyReport report = detector_.detect(bars);
    ASSERT_EQ(report.anomalies.size(), 1u);

    const AnomalyRecord& record = report.anomalies.front();
    EXPECT_EQ(record.time, bars[7].open_time);
    EXPECT_EQ(record.kinds, (std::vector<AnomalyKind>{AnomalyKind::VolumeSpike, AnomalyKind::NetInflowSpike}));
    ASSERT_TRUE(record.volume.has_value());
    EXPECT_NEAR(record.volume->z_score, 3.0, 1e-9);
    EXPECT_EQ(record.volume->direction, Severity::High);
    ASSERT_TRUE(record.net_inflow.has_value());
    EXPECT_NEAR(record.net_inflow->z_score, 3.0, 1e-9);
    EXPECT_FALSE(record.flow_ratio.has_value());
}

TEST_F(ZScoreAnomalyTest, KeepsOnlyTheMostRecentRecords) {
    // Twelve 2% moves on below-average volume, then eight quiet heavy bars
    std::vector<Bar> bars;
    for (size_t i = 0; i < 12; ++i) {
        bars.push_back(make_bar(i, 100.0, 102.0, 5.0));
    }
    for (size_t i = 12; i < 20; ++i) {
        bars.push_back(make_bar(i, 100.0, 100.0, 20.0));
    }

    AnomalyReport report = detector_.detect(bars);
    ASSERT_EQ(report.anomalies.size(), ZScoreAnomalyDetector::kMaxRecords);
    for (size_t k = 0; k < report.anomalies.size(); ++k) {
        const AnomalyRecord& record = report.anomalies[k];
        EXPECT_EQ(record.time, bars[7 + k].open_time);
        EXPECT_EQ(record.kinds, std::vector<AnomalyKind>{AnomalyKind::PriceVolumeMismatch});
        ASSERT_TRUE(record.mismatch.has_value());
        EXPECT_NEAR(record.mismatch->price_change, 2.0, 1e-9);
        EXPECT_LT(record.mismatch->volume_z_score, 0.0);
    }
}

TEST(AnomalyFactoryTest, BuildsConfiguredMode) {
    EXPECT_EQ(make_anomaly_detector(AnomalyMode::Ratio)->name(), "ratio");
    EXPECT_EQ(make_anomaly_detector(AnomalyMode::ZScore)->name(), "zscore");
}
