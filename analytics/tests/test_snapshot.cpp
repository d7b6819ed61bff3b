#include "snapshot.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using json = nlohmann::json;

class SnapshotTest : public ::testing::Test {
protected:
    Config config_;
};

TEST_F(SnapshotTest, ParsesStringAndNumericFields) {
    json row = {1700000000000LL, "100.5", 101, "99.75", "100.25", "12.5", 1700003599999LL, "1253.1", 7};
    RawBar bar = parse_kline_row(row);
    EXPECT_EQ(bar.open_time, 1700000000000LL);
    EXPECT_DOUBLE_EQ(bar.open, 100.5);
    EXPECT_DOUBLE_EQ(bar.high, 101.0);
    EXPECT_DOUBLE_EQ(bar.low, 99.75);
    EXPECT_DOUBLE_EQ(bar.close, 100.25);
    EXPECT_DOUBLE_EQ(bar.volume, 12.5);
    EXPECT_EQ(bar.close_time, 1700003599999LL);
    EXPECT_DOUBLE_EQ(bar.quote_volume, 1253.1);

    DepthLevel level = parse_depth_level(json::array({"65000.10", 0.25}));
    EXPECT_DOUBLE_EQ(level.price, 65000.10);
    EXPECT_DOUBLE_EQ(level.quantity, 0.25);
}

TEST_F(SnapshotTest, RejectsShortOrNonNumericRows) {
    EXPECT_THROW(parse_kline_row(json::array({1, "2", "3"})), InvalidInput);
    EXPECT_THROW(parse_kline_row(json::array({0, "abc", "1", "1", "1", "1", 1, "1"})), InvalidInput);
    EXPECT_THROW(parse_kline_row(json::array({0, "1.5x", "1", "1", "1", "1", 1, "1"})), InvalidInput);
    EXPECT_THROW(parse_kline_row(json::array({0, nullptr, "1", "1", "1", "1", 1, "1"})), InvalidInput);
    EXPECT_THROW(parse_depth_level(json::array({"1.0"})), InvalidInput);
}

TEST_F(SnapshotTest, ParsesFullSnapshot) {
    AnalysisRequest request = parse_snapshot(testing_helpers::snapshot_json({"BTCUSDT", "ETHUSDT"}), config_);
    EXPECT_EQ(request.interval, Interval::H1);
    EXPECT_EQ(request.limit, 12);
    ASSERT_EQ(request.symbols.size(), 2u);
    EXPECT_EQ(request.symbols[0].symbol, "BTCUSDT");
    EXPECT_EQ(request.symbols[0].spot.klines.size(), 13u);
    EXPECT_EQ(request.symbols[0].futures.bids.size(), 2u);
    EXPECT_DOUBLE_EQ(request.symbols[0].spot.asks[0].price, 101.0);
}

TEST_F(SnapshotTest, IntervalFallsBackToConfig) {
    json j = testing_helpers::snapshot_json({"BTCUSDT"});
    j.erase("interval");
    j.erase("limit");
    config_.interval = Interval::D1;

    AnalysisRequest request = parse_snapshot(j, config_);
    EXPECT_EQ(request.interval, Interval::D1);
    EXPECT_EQ(request.limit, 0);
}

TEST_F(SnapshotTest, RejectsMalformedStructure) {
    EXPECT_THROW(parse_snapshot(json::array(), config_), InvalidInput);
    EXPECT_THROW(parse_snapshot(json{{"symbols", json::object()}}, config_), InvalidInput);

    json bad_interval = testing_helpers::snapshot_json({"BTCUSDT"});
    bad_interval["interval"] = "2h";
    EXPECT_THROW(parse_snapshot(bad_interval, config_), InvalidInput);

    json no_futures = testing_helpers::snapshot_json({"BTCUSDT"});
    no_futures["symbols"]["BTCUSDT"].erase("futures");
    EXPECT_THROW(parse_snapshot(no_futures, config_), InvalidInput);

    json no_depth = testing_helpers::snapshot_json({"BTCUSDT"});
    no_depth["symbols"]["BTCUSDT"]["spot"].erase("depth");
    EXPECT_THROW(parse_snapshot(no_depth, config_), InvalidInput);

    json bad_limit = testing_helpers::snapshot_json({"BTCUSDT"});
    bad_limit["limit"] = 0;
    EXPECT_THROW(parse_snapshot(bad_limit, config_), InvalidInput);
}

TEST_F(SnapshotTest, ErrorNamesSymbolAndMarket) {
    json j = testing_helpers::snapshot_json({"SOLUSDT"});
    j["symbols"]["SOLUSDT"]["futures"]["klines"][3][4] = "oops";
    try {
        parse_snapshot(j, config_);
        FAIL() << "expected InvalidInput";
    } catch (const InvalidInput& e) {
        EXPECT_NE(std::string(e.what()).find("SOLUSDT futures"), std::string::npos);
    }
}

TEST_F(SnapshotTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "flowscout_snapshot.json";
    {
        std::ofstream out(path);
        out << testing_helpers::snapshot_json({"BTCUSDT"}).dump();
    }
    AnalysisRequest request = load_snapshot_file(path, config_);
    EXPECT_EQ(request.symbols.size(), 1u);
    std::remove(path.c_str());

    EXPECT_THROW(load_snapshot_file("/nonexistent/snapshot.json", config_), std::runtime_error);
}

TEST_F(SnapshotTest, RejectsNonFiniteNumbers) {
    for (const char* text : {"nan", "NaN", "inf", "-inf", "infinity"}) {
        EXPECT_THROW(parse_kline_row(json::array({0, "100", "101", "99", text, "1", 1, "1"})), InvalidInput)
            << text;
        EXPECT_THROW(parse_depth_level(json::array({"100", text})), InvalidInput) << text;
    }
}

TEST_F(SnapshotTest, RejectsTimestampsOutsideInt64) {
    EXPECT_THROW(parse_kline_row(json::array({"1e30", "1", "1", "1", "1", "1", 1, "1"})), InvalidInput);
    EXPECT_THROW(parse_kline_row(json::array({0, "1", "1", "1", "1", "1", "nan", "1"})), InvalidInput);
    EXPECT_THROW(parse_kline_row(json::array({18446744073709551615ULL, "1", "1", "1", "1", "1", 1, "1"})),
                 InvalidInput);

    RawBar bar = parse_kline_row(json::array({"1700000000000", "1", "1", "1", "1", "1", 1700003599999LL, "1"}));
    EXPECT_EQ(bar.open_time, 1700000000000LL);
}

TEST_F(SnapshotTest, RejectsLimitOutsideIntRange) {
    json j = testing_helpers::snapshot_json({"BTCUSDT"});
    j["limit"] = 10000000000LL;
    EXPECT_THROW(parse_snapshot(j, config_), InvalidInput);

    j["limit"] = 12.5;
    EXPECT_THROW(parse_snapshot(j, config_), InvalidInput);

    j["limit"] = -3;
    EXPECT_THROW(parse_snapshot(j, config_), InvalidInput);
}

TEST_F(SnapshotTest, NanInMarketDataFailsBeforeAnalysis) {
    json j = testing_helpers::snapshot_json({"BTCUSDT"});
    j["symbols"]["BTCUSDT"]["spot"]["klines"][2][4] = "nan";
    j["symbols"]["BTCUSDT"]["spot"]["depth"]["bids"][0][1] = "nan";

    try {
        parse_snapshot(j, config_);
        FAIL() << "expected InvalidInput";
    } catch (const InvalidInput& e) {
        EXPECT_NE(std::string(e.what()).find("BTCUSDT spot"), std::string::npos);
    }
}
