#include "depth_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace {
    struct SideTotals {
        double quantity = 0.0;
        double notional = 0.0;
        double best_high = 0.0;
        double best_low = std::numeric_limits<double>::max();
    };

    SideTotals sum_side(const std::vector<DepthLevel>& levels, size_t count, const char* side) {
        SideTotals totals;
        for (size_t i = 0; i < count; ++i) {
            const auto& level = levels[i];
            if (!(level.price > 0.0) || !(level.quantity >= 0.0) ||
                !std::isfinite(level.price) || !std::isfinite(level.quantity)) {
                throw InvalidInput(fmt::format("Malformed {} level {}: price={} qty={}",
                                               side, i, level.price, level.quantity));
            }
            totals.quantity += level.quantity;
            totals.notional += level.price * level.quantity;
            totals.best_high = std::max(totals.best_high, level.price);
            totals.best_low = std::min(totals.best_low, level.price);
        }
        return totals;
    }
}

DepthAggregator::DepthAggregator(int depth_limit) : depth_limit_(depth_limit) {}

OrderBookStats DepthAggregator::aggregate(const std::vector<DepthLevel>& bids,
                                          const std::vector<DepthLevel>& asks) const {
    if (bids.empty() || asks.empty()) {
        throw InvalidInput(fmt::format("Order book side is empty (bids={}, asks={})",
                                       bids.size(), asks.size()));
    }

    auto capped = [this](size_t n) {
        return depth_limit_ > 0 ? std::min(n, static_cast<size_t>(depth_limit_)) : n;
    };

    SideTotals bid = sum_side(bids, capped(bids.size()), "bid");
    SideTotals ask = sum_side(asks, capped(asks.size()), "ask");

    OrderBookStats stats;
    stats.total_bid_qty = bid.quantity;
    stats.total_ask_qty = ask.quantity;

    double total_qty = bid.quantity + ask.quantity;
    stats.imbalance = total_qty == 0.0 ? 0.0 : (bid.quantity - ask.quantity) / total_qty;

    stats.bid_pressure = bid.notional;
    stats.ask_pressure = ask.notional;
    stats.pressure_ratio = ask.notional > 0.0
        ? bid.notional / ask.notional
        : std::numeric_limits<double>::infinity();

    stats.best_bid = bid.best_high;
    stats.best_ask = ask.best_low;
    stats.spread = stats.best_ask - stats.best_bid;
    stats.spread_pct = stats.spread / stats.best_bid * 100.0;
    return stats;
}
