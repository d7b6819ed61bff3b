#include "snapshot.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    // Kline row layout used by the exchange
    constexpr size_t kOpenTime = 0;
    constexpr size_t kOpen = 1;
    constexpr size_t kHigh = 2;
    constexpr size_t kLow = 3;
    constexpr size_t kClose = 4;
    constexpr size_t kVolume = 5;
    constexpr size_t kCloseTime = 6;
    constexpr size_t kQuoteVolume = 7;

    // Finite values only: stod also accepts "nan" and "inf"
    double to_number(const json& value, const char* field) {
        if (value.is_number()) {
            double number = value.get<double>();
            if (!std::isfinite(number)) {
                throw InvalidInput(fmt::format("Field '{}' is not finite", field));
            }
            return number;
        }
        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            try {
                size_t consumed = 0;
                double parsed = std::stod(text, &consumed);
                if (consumed == text.size() && std::isfinite(parsed)) {
                    return parsed;
                }
            } catch (const std::exception&) {
                // reported below
            }
            throw InvalidInput(fmt::format("Field '{}' is not a number: \"{}\"", field, text));
        }
        throw InvalidInput(fmt::format("Field '{}' has type {}, expected number", field, value.type_name()));
    }

    int64_t to_timestamp(const json& value, const char* field) {
        if (value.is_number_unsigned()) {
            if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw InvalidInput(fmt::format("Field '{}' is out of range", field));
            }
            return value.get<int64_t>();
        }
        if (value.is_number_integer()) {
            return value.get<int64_t>();
        }

        // 2^63 is exact as a double; anything at or past it does not fit
        constexpr double kLimit = 9223372036854775808.0;
        double number = to_number(value, field);
        if (number >= kLimit || number < -kLimit) {
            throw InvalidInput(fmt::format("Field '{}' is out of range: {}", field, number));
        }
        return static_cast<int64_t>(number);
    }

    MarketSnapshot parse_market(const json& j, const std::string& symbol, const char* market) {
        if (!j.is_object()) {
            throw InvalidInput(fmt::format("{} {}: market entry must be an object", symbol, market));
        }

        MarketSnapshot snapshot;
        try {
            for (const auto& row : j.at("klines")) {
                snapshot.klines.push_back(parse_kline_row(row));
            }

            const auto& depth = j.at("depth");
            for (const auto& level : depth.at("bids")) {
                snapshot.bids.push_back(parse_depth_level(level));
            }
            for (const auto& level : depth.at("asks")) {
                snapshot.asks.push_back(parse_depth_level(level));
            }
        } catch (const json::exception& e) {
            throw InvalidInput(fmt::format("{} {}: {}", symbol, market, e.what()));
        } catch (const InvalidInput& e) {
            throw InvalidInput(fmt::format("{} {}: {}", symbol, market, e.what()));
        }
        return snapshot;
    }
}

RawBar parse_kline_row(const json& row) {
    if (!row.is_array() || row.size() <= kQuoteVolume) {
        throw InvalidInput(fmt::format("Kline row must be an array of at least {} fields", kQuoteVolume + 1));
    }

    RawBar bar;
    bar.open_time = to_timestamp(row[kOpenTime], "open_time");
    bar.open = to_number(row[kOpen], "open");
    bar.high = to_number(row[kHigh], "high");
    bar.low = to_number(row[kLow], "low");
    bar.close = to_number(row[kClose], "close");
    bar.volume = to_number(row[kVolume], "volume");
    bar.close_time = to_timestamp(row[kCloseTime], "close_time");
    bar.quote_volume = to_number(row[kQuoteVolume], "quote_volume");
    return bar;
}

DepthLevel parse_depth_level(const json& level) {
    if (!level.is_array() || level.size() < 2) {
        throw InvalidInput("Depth level must be a [price, quantity] pair");
    }
    return DepthLevel{to_number(level[0], "price"), to_number(level[1], "quantity")};
}

AnalysisRequest parse_snapshot(const json& j, const Config& config) {
    if (!j.is_object() || !j.contains("symbols") || !j.at("symbols").is_object()) {
        throw InvalidInput("Snapshot must be an object with a 'symbols' object");
    }

    AnalysisRequest request;
    request.interval = config.interval;
    if (j.contains("interval")) {
        if (!j.at("interval").is_string()) {
            throw InvalidInput("'interval' must be a string");
        }
        request.interval = parse_interval(j.at("interval").get<std::string>());
    }

    if (j.contains("limit")) {
        const auto& limit = j.at("limit");
        bool in_range = limit.is_number_unsigned()
            ? limit.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
            : limit.is_number_integer() && limit.get<int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range || limit.get<int64_t>() < 1) {
            throw InvalidInput("'limit' must be a positive integer");
        }
        request.limit = limit.get<int>();
    }

    for (const auto& [symbol, markets] : j.at("symbols").items()) {
        if (!markets.is_object() || !markets.contains("spot") || !markets.contains("futures")) {
            throw InvalidInput(fmt::format("{}: both 'spot' and 'futures' snapshots are required", symbol));
        }

        SymbolSnapshot snapshot;
        snapshot.symbol = symbol;
        snapshot.spot = parse_market(markets.at("spot"), symbol, "spot");
        snapshot.futures = parse_market(markets.at("futures"), symbol, "futures");
        request.symbols.push_back(std::move(snapshot));
    }

    if (request.symbols.empty()) {
        throw InvalidInput("Snapshot contains no symbols");
    }

    spdlog::debug("Parsed snapshot: {} symbol(s), interval {}", request.symbols.size(), to_string(request.interval));
    return request;
}

AnalysisRequest load_snapshot_file(const std::string& path, const Config& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open snapshot file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw InvalidInput(fmt::format("Snapshot {} is not valid JSON: {}", path, e.what()));
    }
    return parse_snapshot(j, config);
}
